#include "test.hpp"

#include <algorithm>
#include <cstring>

#include "h5cx/core/compound/MemberCodec.hpp"
#include "h5cx/core/util/Errors.hpp"

using namespace h5cx;

namespace {

std::vector<std::byte> filled(std::size_t n, std::byte value = std::byte{0xAB})
{
    return std::vector<std::byte>(n, value);
}

bool allEqual(const std::vector<std::byte>& buf, std::byte value)
{
    return std::all_of(buf.begin(), buf.end(), [&](std::byte b) { return b == value; });
}

}  // namespace

// --- numeric kinds -----------------------------------------------------------

TEST(MemberCodec, ScalarRoundTrip)
{
    auto layout = planLayout(RecordShapeBuilder()
                                 .scalar<std::int8_t>("a")
                                 .scalar<std::uint64_t>("b")
                                 .scalar<float>("c")
                                 .build());
    auto buf = filled(layout->totalLength());

    encodeMember(Value(std::int8_t{-7}), layout->at("a"), buf);
    encodeMember(Value(std::uint64_t{1} << 40), layout->at("b"), buf);
    encodeMember(Value(2.5f), layout->at("c"), buf);

    EXPECT_TRUE(decodeMember(buf, layout->at("a")) == Value(std::int8_t{-7}));
    EXPECT_TRUE(decodeMember(buf, layout->at("b")) == Value(std::uint64_t{1} << 40));
    EXPECT_TRUE(decodeMember(buf, layout->at("c")) == Value(2.5f));

    std::int8_t raw;
    std::memcpy(&raw, buf.data(), 1);
    EXPECT_EQ(raw, -7);
}

TEST(MemberCodec, FixedArrayZeroPadsShortValues)
{
    auto layout = planLayout(RecordShapeBuilder().array<std::int32_t>("v", 4).build());
    auto buf = filled(layout->totalLength());

    encodeMember(Value(std::vector<std::int32_t>{1, 2}), layout->at("v"), buf);
    auto decoded = std::get<std::vector<std::int32_t>>(decodeMember(buf, layout->at("v")));
    std::vector<std::int32_t> expected{1, 2, 0, 0};
    EXPECT_EQ(decoded, expected);
}

TEST(MemberCodec, FixedArrayTooLongWritesNothing)
{
    auto layout = planLayout(RecordShapeBuilder().array<double>("v", 2).build());
    auto buf = filled(layout->totalLength());

    std::vector<double> tooMany{1.0, 2.0, 3.0};
    EXPECT_THROW(encodeMember(Value(tooMany), layout->at("v"), buf), DimensionMismatchError);
    EXPECT_TRUE(allEqual(buf, std::byte{0xAB}));
}

TEST(MemberCodec, MatrixRoundTripIsRowMajor)
{
    auto layout = planLayout(RecordShapeBuilder().matrix<std::int16_t>("m", 2, 3).build());
    auto buf = filled(layout->totalLength());

    Matrix<std::int16_t> m{{1, 2, 3}, {4, 5, 6}};
    encodeMember(Value(m), layout->at("m"), buf);

    std::int16_t flat[6];
    std::memcpy(flat, buf.data(), sizeof(flat));
    for (int i = 0; i < 6; ++i) {
        EXPECT_EQ(flat[i], i + 1);
    }
    EXPECT_TRUE(std::get<Matrix<std::int16_t>>(decodeMember(buf, layout->at("m"))) == m);
}

TEST(MemberCodec, MatrixDimensionMismatchWritesNothing)
{
    auto layout = planLayout(RecordShapeBuilder().matrix<float>("m", 2, 3).build());
    auto buf = filled(layout->totalLength());

    Matrix<float> wrongCols{{1, 2}, {3, 4}};
    EXPECT_THROW(encodeMember(Value(wrongCols), layout->at("m"), buf), DimensionMismatchError);

    Matrix<float> ragged{{1, 2, 3}, {4, 5}};
    EXPECT_THROW(encodeMember(Value(ragged), layout->at("m"), buf), DimensionMismatchError);

    Matrix<float> wrongRows{{1, 2, 3}};
    EXPECT_THROW(encodeMember(Value(wrongRows), layout->at("m"), buf), DimensionMismatchError);

    EXPECT_TRUE(allEqual(buf, std::byte{0xAB}));
}

TEST(MemberCodec, NDArrayRoundTrip)
{
    auto layout = planLayout(RecordShapeBuilder().ndarray<double>("cube", {2, 3, 4}).build());
    auto buf = filled(layout->totalLength());

    xt::xarray<double> cube = xt::xarray<double>::from_shape({2, 3, 4});
    for (std::size_t i = 0; i < cube.size(); ++i) {
        cube.data()[i] = 0.5 * static_cast<double>(i);
    }
    encodeMember(Value(cube), layout->at("cube"), buf);

    auto back = std::get<xt::xarray<double>>(decodeMember(buf, layout->at("cube")));
    ASSERT_EQ(back.dimension(), 3u);
    EXPECT_EQ(back.shape()[0], 2u);
    EXPECT_EQ(back.shape()[1], 3u);
    EXPECT_EQ(back.shape()[2], 4u);
    EXPECT_FLOAT_EQ(back(1, 2, 3), 0.5 * 23);
}

TEST(MemberCodec, NDArrayShapeMismatchWritesNothing)
{
    auto layout = planLayout(RecordShapeBuilder().ndarray<float>("cube", {2, 2, 2}).build());
    auto buf = filled(layout->totalLength());

    xt::xarray<float> flat = xt::xarray<float>::from_shape({8});
    EXPECT_THROW(encodeMember(Value(flat), layout->at("cube"), buf), DimensionMismatchError);
    EXPECT_TRUE(allEqual(buf, std::byte{0xAB}));
}

TEST(MemberCodec, ZeroLengthMembers)
{
    auto layout = planLayout(RecordShapeBuilder()
                                 .array<float>("a", 0)
                                 .matrix<std::int32_t>("m", 0, 3)
                                 .build());
    EXPECT_EQ(layout->totalLength(), 0u);
    std::vector<std::byte> buf;

    EXPECT_NO_THROW(encodeMember(Value(std::vector<float>{}), layout->at("a"), buf));
    EXPECT_NO_THROW(encodeMember(Value(Matrix<std::int32_t>{}), layout->at("m"), buf));

    EXPECT_TRUE(std::get<std::vector<float>>(decodeMember(buf, layout->at("a"))).empty());
    EXPECT_TRUE(std::get<Matrix<std::int32_t>>(decodeMember(buf, layout->at("m"))).empty());
}

TEST(MemberCodec, WrongAlternativeIsValueTypeError)
{
    auto layout = planLayout(RecordShapeBuilder()
                                 .scalar<std::int32_t>("i")
                                 .array<double>("v", 2)
                                 .build());
    auto buf = filled(layout->totalLength());

    EXPECT_THROW(encodeMember(Value(1.0), layout->at("i"), buf), ValueTypeError);
    EXPECT_THROW(encodeMember(Value(std::vector<float>{1.0f}), layout->at("v"), buf), ValueTypeError);
    EXPECT_TRUE(allEqual(buf, std::byte{0xAB}));
}

// --- strings, enums, compounds -----------------------------------------------

TEST(MemberCodec, BooleansAreOneByte)
{
    auto layout = planLayout(RecordShapeBuilder().boolean("on").boolean("off").build());
    EXPECT_EQ(layout->totalLength(), 2u);
    auto buf = filled(layout->totalLength());

    encodeMember(Value(true), layout->at("on"), buf);
    encodeMember(Value(false), layout->at("off"), buf);
    EXPECT_TRUE(buf[0] == std::byte{1});
    EXPECT_TRUE(buf[1] == std::byte{0});
    EXPECT_TRUE(decodeMember(buf, layout->at("on")) == Value(true));
    EXPECT_TRUE(decodeMember(buf, layout->at("off")) == Value(false));

    buf[1] = std::byte{0x7F};
    EXPECT_TRUE(decodeMember(buf, layout->at("off")) == Value(true));

    EXPECT_THROW(encodeMember(Value(std::int8_t{1}), layout->at("on"), buf), ValueTypeError);

    MemberSpec flags;
    flags.name = "flags";
    flags.kind = ElementKind::FixedArray;
    flags.primitive = PrimitiveType::Bool;
    flags.dimensions = {4};
    EXPECT_THROW(planLayout(RecordShapeBuilder().member(flags).build()), InvalidShapeError);
}

TEST(MemberCodec, StringsTruncateAndTerminate)
{
    auto layout = planLayout(RecordShapeBuilder().string("s", 4).build());
    const auto& m = layout->at("s");
    EXPECT_EQ(m.length, 5u);

    auto buf = filled(layout->totalLength());
    encodeMember(Value(std::string("ab")), m, buf);
    EXPECT_TRUE(decodeMember(buf, m) == Value(std::string("ab")));
    EXPECT_TRUE(buf[2] == std::byte{0});
    EXPECT_TRUE(buf[4] == std::byte{0});

    encodeMember(Value(std::string("abcdefgh")), m, buf);
    EXPECT_TRUE(decodeMember(buf, m) == Value(std::string("abcd")));
    EXPECT_TRUE(buf[4] == std::byte{0});
}

TEST(MemberCodec, EnumByName)
{
    auto colours = EnumType::create("Colour", {"RED", "GREEN", "BLUE"});
    auto layout = planLayout(RecordShapeBuilder()
                                 .enumeration("c", colours)
                                 .enumArray("cs", colours, 3)
                                 .build());
    auto buf = filled(layout->totalLength());

    encodeMember(Value(EnumValue{"BLUE"}), layout->at("c"), buf);
    EXPECT_TRUE(buf[0] == std::byte{2});
    EXPECT_TRUE(decodeMember(buf, layout->at("c")) == Value(EnumValue{"BLUE"}));

    std::vector<EnumValue> two{{"GREEN"}, {"RED"}};
    encodeMember(Value(two), layout->at("cs"), buf);
    auto back = std::get<std::vector<EnumValue>>(decodeMember(buf, layout->at("cs")));
    ASSERT_EQ(back.size(), 3u);
    EXPECT_EQ(back[0].name, "GREEN");
    EXPECT_EQ(back[1].name, "RED");
    EXPECT_EQ(back[2].name, "RED");

    EXPECT_THROW(encodeMember(Value(EnumValue{"PURPLE"}), layout->at("c"), buf), ValueTypeError);
}

TEST(MemberCodec, NestedCompoundRoundTrip)
{
    auto inner = RecordShapeBuilder().scalar<std::int32_t>("x").string("tag", 3).build();
    auto layout = planLayout(RecordShapeBuilder().scalar<double>("w").compound("inner", inner).build());
    auto buf = filled(layout->totalLength());

    MapRecord members;
    members["x"] = std::int32_t{42};
    members["tag"] = std::string("abc");
    CompoundValue value(members);
    encodeMember(Value(value), layout->at("inner"), buf);

    auto back = std::get<CompoundValue>(decodeMember(buf, layout->at("inner")));
    EXPECT_TRUE(back == value);
}

TEST(MemberCodec, NestedCompoundFailureWritesNothing)
{
    auto inner = RecordShapeBuilder().scalar<std::int32_t>("x").array<float>("v", 1).build();
    auto layout = planLayout(RecordShapeBuilder().compound("inner", inner).build());
    auto buf = filled(layout->totalLength());

    MapRecord members;
    members["x"] = std::int32_t{1};
    members["v"] = std::vector<float>{1.0f, 2.0f};
    EXPECT_THROW(
        encodeMember(Value(CompoundValue(members)), layout->at("inner"), buf),
        DimensionMismatchError);
    EXPECT_TRUE(allEqual(buf, std::byte{0xAB}));
}

TEST(MemberCodec, ShortBufferIsEncodingError)
{
    auto layout = planLayout(RecordShapeBuilder().scalar<std::int32_t>("a").scalar<double>("b").build());
    std::vector<std::byte> buf(6);
    EXPECT_THROW(encodeMember(Value(1.0), layout->at("b"), buf), EncodingError);
    EXPECT_THROW(decodeMember(buf, layout->at("b")), EncodingError);
}

// --- accessors ---------------------------------------------------------------

namespace {

struct Point {
    std::int32_t id = 0;
    std::vector<float> xyz;
};

}  // namespace

TEST(ValueAccessor, FieldMapAndListAgree)
{
    auto layout = planLayout(RecordShapeBuilder().scalar<std::int32_t>("id").array<float>("xyz", 3).build());

    Point p{7, {1.0f, 2.0f, 3.0f}};
    MemberCodec<Point> fieldId(std::make_shared<FieldAccessor<Point, std::int32_t>>(&Point::id), layout->at("id"));
    MemberCodec<Point> fieldXyz(
        std::make_shared<FieldAccessor<Point, std::vector<float>>>(&Point::xyz), layout->at("xyz"));

    std::vector<std::byte> fromStruct(layout->totalLength());
    fieldId.encode(p, fromStruct);
    fieldXyz.encode(p, fromStruct);

    MapRecord map;
    map["id"] = std::int32_t{7};
    map["xyz"] = std::vector<float>{1.0f, 2.0f, 3.0f};
    std::vector<std::byte> fromMap(layout->totalLength());
    MemberCodec<MapRecord>(std::make_shared<MapAccessor>("id"), layout->at("id")).encode(map, fromMap);
    MemberCodec<MapRecord>(std::make_shared<MapAccessor>("xyz"), layout->at("xyz")).encode(map, fromMap);

    ListRecord list{Value(std::int32_t{7}), Value(std::vector<float>{1.0f, 2.0f, 3.0f})};
    std::vector<std::byte> fromList(layout->totalLength());
    MemberCodec<ListRecord>(std::make_shared<ListAccessor>(0), layout->at("id")).encode(list, fromList);
    MemberCodec<ListRecord>(std::make_shared<ListAccessor>(1), layout->at("xyz")).encode(list, fromList);

    EXPECT_TRUE(fromStruct == fromMap);
    EXPECT_TRUE(fromStruct == fromList);

    Point back;
    fieldId.decode(fromList, back);
    fieldXyz.decode(fromList, back);
    EXPECT_EQ(back.id, 7);
    EXPECT_EQ(back.xyz, p.xyz);
}

TEST(ValueAccessor, MissingEntries)
{
    MapAccessor byName("absent");
    EXPECT_THROW(byName.get(MapRecord{}), ValueTypeError);

    ListAccessor byPosition(2);
    ListRecord list;
    EXPECT_THROW(byPosition.get(list), ValueTypeError);
    byPosition.set(list, Value(std::int32_t{5}));
    EXPECT_EQ(list.size(), 3u);
    EXPECT_TRUE(list[2] == Value(std::int32_t{5}));
}
