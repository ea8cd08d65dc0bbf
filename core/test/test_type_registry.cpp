#include "test.hpp"

#include <thread>

#include "h5cx/core/h5/H5File.hpp"
#include "h5cx/core/util/Errors.hpp"
#include "h5cx/core/util/Logging.hpp"

using namespace h5cx;

namespace {

RecordShape versionOne()
{
    return RecordShapeBuilder()
        .scalar<std::int32_t>("id")
        .array<double>("position", 3)
        .build();
}

RecordShape versionTwo()
{
    return RecordShapeBuilder()
        .scalar<std::int32_t>("id")
        .array<double>("position", 3)
        .string("label", 15)
        .build();
}

std::vector<std::string> memberNames(const std::vector<h5::CommittedMember>& members)
{
    std::vector<std::string> names;
    for (const auto& m : members) {
        names.push_back(m.name);
    }
    return names;
}

struct QuietLogs {
    QuietLogs() { Logger()->set_level(LogLevel::Error); }
    ~QuietLogs() { Logger()->set_level(LogLevel::Info); }
};

}  // namespace

TEST(TypeRegistry, CommittedPath)
{
    EXPECT_EQ(TypeRegistry::committedPath("Sample"), "/__DATA_TYPES__/Compound_Sample");
}

TEST(TypeRegistry, CommitOnceThenReuse)
{
    QuietLogs quiet;
    h5cx_test::TempFile tmp("types_reuse");
    auto file = H5File::create(tmp.path());

    EXPECT_FALSE(file->types().contains("Sample"));
    auto first = file->compoundType("Sample", versionOne());
    auto second = file->compoundType("Sample", versionOne());

    EXPECT_TRUE(file->types().contains("Sample"));
    EXPECT_TRUE(file->exists(TypeRegistry::committedPath("Sample")));
    EXPECT_EQ(file->types().commitCount(), 1u);
    EXPECT_TRUE(first == second);
    EXPECT_TRUE(H5Tequal(first->storageTypeId(), second->storageTypeId()) > 0);
    EXPECT_EQ(first->recordSize(), 28u);
    file->close();
}

TEST(TypeRegistry, ReopenedFileReusesCommittedType)
{
    QuietLogs quiet;
    h5cx_test::TempFile tmp("types_reopen");
    {
        auto file = H5File::create(tmp.path());
        file->compoundType("Sample", versionOne());
        file->close();
    }

    auto file = H5File::open(tmp.path());
    auto type = file->compoundType("Sample", versionOne());
    EXPECT_EQ(file->types().commitCount(), 0u);
    EXPECT_EQ(type->recordSize(), 28u);

    // cached after the first lookup
    auto again = file->compoundType("Sample", versionOne());
    EXPECT_TRUE(type == again);
}

TEST(TypeRegistry, ConflictingTypeIsReplaced)
{
    QuietLogs quiet;
    h5cx_test::TempFile tmp("types_replace");
    auto file = H5File::create(tmp.path());

    file->compoundType("Sample", versionOne());
    auto replaced = file->compoundType("Sample", versionTwo());

    EXPECT_EQ(file->types().commitCount(), 2u);
    EXPECT_EQ(replaced->recordSize(), 28u + 16u);

    auto names = memberNames(file->describeType("Sample"));
    std::vector<std::string> expected{"id", "position", "label"};
    EXPECT_EQ(names, expected);
}

TEST(TypeRegistry, ConflictIsRefusedWhenReplacementDisabled)
{
    QuietLogs quiet;
    h5cx_test::TempFile tmp("types_refuse");
    ContainerConfig config;
    config.replaceConflictingTypes = false;
    auto file = H5File::create(tmp.path(), config);

    file->compoundType("Sample", versionOne());
    EXPECT_THROW(file->compoundType("Sample", versionTwo()), TypeConflictError);

    EXPECT_EQ(file->types().commitCount(), 1u);
    EXPECT_EQ(file->describeType("Sample").size(), 2u);
}

TEST(TypeRegistry, PreferExistingKeepsCommittedType)
{
    QuietLogs quiet;
    h5cx_test::TempFile tmp("types_prefer");
    auto file = H5File::create(tmp.path());

    auto original = file->compoundType("Sample", versionOne());
    auto preferred = file->compoundType("Sample", versionTwo(), true);

    EXPECT_EQ(file->types().commitCount(), 1u);
    EXPECT_TRUE(H5Tequal(original->storageTypeId(), preferred->storageTypeId()) > 0);
    EXPECT_EQ(file->describeType("Sample").size(), 2u);
}

TEST(TypeRegistry, VariantTagsArePartOfTheType)
{
    QuietLogs quiet;
    h5cx_test::TempFile tmp("types_tags");
    auto plain = RecordShapeBuilder().scalar<std::int64_t>("stamp").build();
    auto tagged = RecordShapeBuilder()
                      .scalar<std::int64_t>("stamp", TypeVariant::TimestampMillisecondsSinceEpoch)
                      .build();
    {
        auto file = H5File::create(tmp.path());
        file->compoundType("Event", plain);
        file->compoundType("Event", tagged);
        file->compoundType("Event", tagged);
        EXPECT_EQ(file->types().commitCount(), 2u);
        EXPECT_TRUE(
            file->describeType("Event")[0].variant == TypeVariant::TimestampMillisecondsSinceEpoch);
    }

    auto file = H5File::open(tmp.path());
    file->compoundType("Event", tagged);
    EXPECT_EQ(file->types().commitCount(), 0u);

    file->compoundType("Event", plain);
    EXPECT_EQ(file->types().commitCount(), 1u);
    EXPECT_TRUE(file->describeType("Event")[0].variant == TypeVariant::None);
}

TEST(TypeRegistry, ConcurrentLookupsCommitOnce)
{
    QuietLogs quiet;
    h5cx_test::TempFile tmp("types_threads");
    auto file = H5File::create(tmp.path());
    const auto shape = versionTwo();

    constexpr std::size_t kThreads = 8;
    std::vector<std::shared_ptr<const CompoundType>> results(kThreads);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] { results[i] = file->compoundType("Shared", shape); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(file->types().commitCount(), 1u);
    for (const auto& r : results) {
        ASSERT_TRUE(r != nullptr);
        EXPECT_TRUE(r == results[0]);
    }
    EXPECT_EQ(results[0]->recordSize(), 44u);
}

TEST(TypeRegistry, DescribeReportsClassesAndVariants)
{
    QuietLogs quiet;
    h5cx_test::TempFile tmp("types_describe");
    auto file = H5File::create(tmp.path());

    auto colours = EnumType::create("Colour", {"RED", "GREEN"});
    auto inner = RecordShapeBuilder().scalar<float>("x").scalar<float>("y").build();
    auto shape = RecordShapeBuilder()
                     .scalar<std::int64_t>("stamp", TypeVariant::TimestampMillisecondsSinceEpoch)
                     .array<float>("unused", 0)
                     .scalar<double>("elapsed", TypeVariant::TimeDurationSeconds)
                     .matrix<std::uint16_t>("grid", 2, 3)
                     .string("label", 7)
                     .enumeration("colour", colours)
                     .compound("point", inner)
                     .build();
    file->compoundType("Tagged", shape);

    auto members = file->describeType("Tagged");
    ASSERT_EQ(members.size(), 6u);

    EXPECT_EQ(members[0].name, "stamp");
    EXPECT_EQ(members[0].typeClass, "integer");
    EXPECT_TRUE(members[0].variant == TypeVariant::TimestampMillisecondsSinceEpoch);

    EXPECT_EQ(members[1].name, "elapsed");
    EXPECT_EQ(members[1].offset, 8u);
    EXPECT_EQ(members[1].typeClass, "float");
    EXPECT_TRUE(members[1].variant == TypeVariant::TimeDurationSeconds);

    EXPECT_EQ(members[2].typeClass, "array");
    EXPECT_EQ(members[2].elementClass, "integer");
    std::vector<std::uint64_t> gridDims{2, 3};
    EXPECT_EQ(members[2].dimensions, gridDims);
    EXPECT_TRUE(members[2].variant == TypeVariant::None);

    EXPECT_EQ(members[3].typeClass, "string");
    EXPECT_EQ(members[3].size, 8u);
    EXPECT_EQ(members[4].typeClass, "enum");
    EXPECT_EQ(members[5].typeClass, "compound");
    EXPECT_EQ(members[5].size, 8u);
}

TEST(TypeRegistry, UntaggedTypeHasNoVariants)
{
    QuietLogs quiet;
    h5cx_test::TempFile tmp("types_untagged");
    auto file = H5File::create(tmp.path());
    file->compoundType("Plain", versionOne());

    for (const auto& m : file->describeType("Plain")) {
        EXPECT_TRUE(m.variant == TypeVariant::None);
    }
}

TEST(TypeRegistry, Errors)
{
    QuietLogs quiet;
    h5cx_test::TempFile tmp("types_errors");
    auto file = H5File::create(tmp.path());

    EXPECT_THROW(file->describeType("Missing"), StorageError);

    auto negative = RecordShapeBuilder().array<float>("v", -1).build();
    EXPECT_THROW(file->compoundType("Bad", negative), InvalidShapeError);
    EXPECT_FALSE(file->types().contains("Bad"));

    EXPECT_THROW(file->compoundType("Empty", RecordShape()), StorageError);
    EXPECT_EQ(file->types().commitCount(), 0u);
}
