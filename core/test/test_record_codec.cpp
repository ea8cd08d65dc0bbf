#include "test.hpp"

#include <cstring>
#include <exception>
#include <string>

#include "h5cx/core/compound/FieldMapping.hpp"
#include "h5cx/core/compound/RecordCodec.hpp"
#include "h5cx/core/util/Errors.hpp"

using namespace h5cx;

namespace {

RecordShape sampleShape()
{
    return RecordShapeBuilder()
        .scalar<std::int32_t>("id")
        .array<double>("position", 3)
        .string("label", 8)
        .build();
}

MapRecord sampleMap()
{
    MapRecord r;
    r["id"] = std::int32_t{11};
    r["position"] = std::vector<double>{1.0, 2.0, 3.0};
    r["label"] = std::string("sensor");
    return r;
}

struct Inner {
    std::int16_t code = 0;
    std::string tag;
};

struct Outer {
    std::int64_t stamp = 0;
    Matrix<float> grid;
    Inner inner;
    EnumValue state;
};

FieldMapping<Inner> innerMapping()
{
    return FieldMapping<Inner>()
        .scalar("code", &Inner::code)
        .string("tag", &Inner::tag, 4);
}

}  // namespace

// --- map and list records ----------------------------------------------------

TEST(RecordCodec, MapRecordRoundTrip)
{
    auto codec = RecordCodec<MapRecord>::forMap(planLayout(sampleShape()));
    EXPECT_EQ(codec.recordSize(), 4u + 24u + 9u);

    auto record = sampleMap();
    auto bytes = codec.byteify(record);
    EXPECT_EQ(bytes.size(), codec.recordSize());

    auto back = codec.unbyteify(bytes);
    EXPECT_TRUE(back == record);
}

TEST(RecordCodec, EveryKindAndPrimitiveRoundTrips)
{
    const std::vector<PrimitiveType> numeric{
        PrimitiveType::Int8, PrimitiveType::Int16, PrimitiveType::Int32, PrimitiveType::Int64,
        PrimitiveType::UInt8, PrimitiveType::UInt16, PrimitiveType::UInt32, PrimitiveType::UInt64,
        PrimitiveType::Float32, PrimitiveType::Float64};

    RecordShapeBuilder builder;
    MapRecord record;
    for (auto p : numeric) {
        const std::string base = toString(p);
        visitNumeric(p, [&]<typename T>(std::type_identity<T>) {
            builder.scalar<T>(base + "_scalar");
            builder.array<T>(base + "_array", 3);
            builder.matrix<T>(base + "_matrix", 2, 3);
            builder.ndarray<T>(base + "_ndarray", {2, 3, 2});

            record[base + "_scalar"] = static_cast<T>(7);
            record[base + "_array"] = std::vector<T>{T(1), T(2), T(3)};
            record[base + "_matrix"] = Matrix<T>{{T(1), T(2), T(3)}, {T(4), T(5), T(6)}};
            auto cube = xt::xarray<T>::from_shape({2, 3, 2});
            for (std::size_t i = 0; i < cube.size(); ++i) {
                cube.data()[i] = static_cast<T>(i);
            }
            record[base + "_ndarray"] = cube;
        });
    }

    auto colours = EnumType::create("Colour", {"RED", "GREEN", "BLUE"});
    builder.boolean("flag")
        .string("name", 12)
        .enumeration("colour", colours)
        .enumArray("palette", colours, 2)
        .compound("inner", RecordShapeBuilder().scalar<std::int16_t>("code").boolean("ok").build());

    MapRecord inner;
    inner["code"] = std::int16_t{-3};
    inner["ok"] = false;
    record["flag"] = true;
    record["name"] = std::string("grid");
    record["colour"] = EnumValue{"BLUE"};
    record["palette"] = std::vector<EnumValue>{EnumValue{"RED"}, EnumValue{"GREEN"}};
    record["inner"] = CompoundValue(inner);

    auto codec = RecordCodec<MapRecord>::forMap(planLayout(builder.build()));
    ASSERT_EQ(codec.layout().size(), 45u);

    auto back = codec.unbyteify(codec.byteify(record));
    ASSERT_EQ(back.size(), record.size());
    for (const auto& [name, value] : record) {
        if (!(back.at(name) == value)) {
            H5CX_TEST_FAIL("member %s did not survive the round trip", name.c_str());
        }
    }
}

TEST(RecordCodec, ListAndMapProduceTheSameBytes)
{
    auto layout = planLayout(sampleShape());
    auto mapCodec = RecordCodec<MapRecord>::forMap(layout);
    auto listCodec = RecordCodec<ListRecord>::forList(layout);

    ListRecord list{
        Value(std::int32_t{11}),
        Value(std::vector<double>{1.0, 2.0, 3.0}),
        Value(std::string("sensor"))};

    auto fromMap = mapCodec.byteify(sampleMap());
    auto fromList = listCodec.byteify(list);
    EXPECT_TRUE(fromMap == fromList);

    auto back = listCodec.unbyteify(fromMap);
    ASSERT_EQ(back.size(), 3u);
    EXPECT_TRUE(back[0] == list[0]);
    EXPECT_TRUE(back[2] == list[2]);
}

TEST(RecordCodec, ManyRecordsBackToBack)
{
    auto codec = RecordCodec<MapRecord>::forMap(planLayout(sampleShape()));

    std::vector<MapRecord> records;
    for (std::int32_t i = 0; i < 5; ++i) {
        auto r = sampleMap();
        r["id"] = i;
        records.push_back(r);
    }

    auto bytes = codec.byteify(std::span<const MapRecord>(records));
    EXPECT_EQ(bytes.size(), 5 * codec.recordSize());

    auto back = codec.arrayify(bytes);
    ASSERT_EQ(back.size(), 5u);
    for (std::int32_t i = 0; i < 5; ++i) {
        EXPECT_TRUE(back[i].at("id") == Value(i));
    }

    auto single = codec.unbyteify(bytes);
    EXPECT_TRUE(single.at("id") == Value(std::int32_t{0}));
}

TEST(RecordCodec, ArrayifyRejectsPartialRecords)
{
    auto codec = RecordCodec<MapRecord>::forMap(planLayout(sampleShape()));
    std::vector<std::byte> bytes(codec.recordSize() * 2 + 1);
    EXPECT_THROW(codec.arrayify(bytes), EncodingError);

    std::vector<std::byte> shortBuffer(codec.recordSize() - 1);
    EXPECT_THROW(codec.unbyteify(shortBuffer), EncodingError);

    EXPECT_TRUE(codec.arrayify(std::span<const std::byte>()).empty());
}

TEST(RecordCodec, FailureNamesTheMember)
{
    auto codec = RecordCodec<MapRecord>::forMap(planLayout(sampleShape()));

    auto record = sampleMap();
    record["position"] = std::vector<double>{1.0, 2.0, 3.0, 4.0};

    std::string member;
    try {
        (void)codec.byteify(record);
    } catch (const EncodingError& e) {
        member = e.member();
    }
    EXPECT_EQ(member, "position");

    record = sampleMap();
    record.erase("label");
    member.clear();
    try {
        (void)codec.byteify(record);
    } catch (const EncodingError& e) {
        member = e.member();
    }
    EXPECT_EQ(member, "label");
}

TEST(RecordCodec, FailureKeepsTheMemberError)
{
    auto shape = RecordShapeBuilder()
                     .scalar<std::int32_t>("id")
                     .matrix<float>("grid", 2, 2)
                     .build();
    auto codec = RecordCodec<MapRecord>::forMap(planLayout(shape));

    MapRecord ragged;
    ragged["id"] = std::int32_t{1};
    ragged["grid"] = Matrix<float>{{1.0f, 2.0f}, {3.0f}};

    std::string member;
    bool dimensionMismatch = false;
    try {
        (void)codec.byteify(ragged);
    } catch (const EncodingError& e) {
        member = e.member();
        try {
            std::rethrow_if_nested(e);
        } catch (const DimensionMismatchError&) {
            dimensionMismatch = true;
        }
    }
    EXPECT_EQ(member, "grid");
    EXPECT_TRUE(dimensionMismatch);

    MapRecord wrongType = ragged;
    wrongType["grid"] = std::int32_t{4};
    bool valueType = false;
    try {
        (void)codec.byteify(wrongType);
    } catch (const EncodingError& e) {
        try {
            std::rethrow_if_nested(e);
        } catch (const ValueTypeError&) {
            valueType = true;
        }
    }
    EXPECT_TRUE(valueType);
}

TEST(RecordCodec, AccessorCountMustMatch)
{
    auto layout = planLayout(sampleShape());
    std::vector<RecordCodec<MapRecord>::AccessorPtr> accessors{std::make_shared<MapAccessor>("id")};
    EXPECT_THROW((void)RecordCodec<MapRecord>(layout, accessors), InvalidShapeError);
}

TEST(RecordCodec, ByteInspectorSeesEveryBuffer)
{
    auto codec = RecordCodec<MapRecord>::forMap(planLayout(sampleShape()));

    int calls = 0;
    std::size_t lastSize = 0;
    std::int32_t firstId = 0;
    codec.setByteInspector([&](std::span<const std::byte> bytes) {
        ++calls;
        lastSize = bytes.size();
        std::memcpy(&firstId, bytes.data(), sizeof(firstId));
    });

    (void)codec.byteify(sampleMap());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(lastSize, codec.recordSize());
    EXPECT_EQ(firstId, 11);

    std::vector<MapRecord> two{sampleMap(), sampleMap()};
    (void)codec.byteify(std::span<const MapRecord>(two));
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(lastSize, 2 * codec.recordSize());
}

// --- struct records ----------------------------------------------------------

TEST(FieldMapping, NestedStructRoundTrip)
{
    auto states = EnumType::create("State", {"IDLE", "RUNNING", "DONE"});
    auto mapping = FieldMapping<Outer>()
                       .scalar("stamp", &Outer::stamp, TypeVariant::TimestampMillisecondsSinceEpoch)
                       .matrix("grid", &Outer::grid, 2, 2)
                       .compound("inner", &Outer::inner, innerMapping())
                       .enumeration("state", &Outer::state, states);

    auto codec = makeFieldCodec(mapping);
    // 8 + 16 + (2 + 5) + 1
    EXPECT_EQ(codec.recordSize(), 32u);
    EXPECT_EQ(codec.layout().at("inner").offset, 24u);

    Outer o;
    o.stamp = 1700000000000;
    o.grid = Matrix<float>{{1.0f, 2.0f}, {3.0f, 4.0f}};
    o.inner = Inner{7, "abcdef"};
    o.state = EnumValue{"RUNNING"};

    auto back = codec.unbyteify(codec.byteify(o));
    EXPECT_EQ(back.stamp, o.stamp);
    EXPECT_TRUE(back.grid == o.grid);
    EXPECT_EQ(back.inner.code, 7);
    EXPECT_EQ(back.inner.tag, "abcd");
    EXPECT_EQ(back.state.name, "RUNNING");
}

TEST(FieldMapping, StructAndMapAgree)
{
    auto mapping = FieldMapping<Inner>()
                       .scalar("code", &Inner::code)
                       .string("tag", &Inner::tag, 4);
    auto fieldCodec = makeFieldCodec(mapping);
    auto mapCodec = RecordCodec<MapRecord>::forMap(fieldCodec.layoutPtr());

    MapRecord map;
    map["code"] = std::int16_t{-3};
    map["tag"] = std::string("xy");

    auto fromStruct = fieldCodec.byteify(Inner{-3, "xy"});
    auto fromMap = mapCodec.byteify(map);
    EXPECT_TRUE(fromStruct == fromMap);
}

TEST(FieldMapping, DecodeFailureNamesTheMember)
{
    auto states = EnumType::create("State", {"IDLE", "RUNNING"});
    auto mapping = FieldMapping<Outer>().enumeration("state", &Outer::state, states);
    auto codec = makeFieldCodec(mapping);

    std::vector<std::byte> bytes{std::byte{9}};
    std::string member;
    try {
        (void)codec.unbyteify(bytes);
    } catch (const EncodingError& e) {
        member = e.member();
    }
    EXPECT_EQ(member, "state");
}
