#include <gtest/gtest.h>

#include <a2s/buffers/ByteReader.hpp>
#include <a2s/buffers/HeapByteWriter.hpp>

using namespace a2s;

TEST(ByteBufferTest, PrimitivesAreLittleEndian) {
    HeapByteWriter writer;
    writer.writeI32(-1);
    writer.writeU16(0x1234);
    writer.writeU8(0x49);

    std::vector<uint8_t> expected = {0xff, 0xff, 0xff, 0xff, 0x34, 0x12, 0x49};
    EXPECT_EQ(writer.toVector(), expected);
}

TEST(ByteBufferTest, RoundTrip) {
    HeapByteWriter writer;
    writer.writeU8(0xab);
    writer.writeI16(-12345);
    writer.writeI32(-2);
    writer.writeU64(76561197960287930ull);
    writer.writeF32(1234.5f);
    ASSERT_TRUE(writer.writeCString("").isOk());
    ASSERT_TRUE(writer.writeCString("Zürich – 東京").isOk());

    auto data = std::move(writer).intoVector();
    ByteReader reader(data);

    EXPECT_EQ(reader.readU8().unwrap(), 0xab);
    EXPECT_EQ(reader.readI16().unwrap(), -12345);
    EXPECT_EQ(reader.readI32().unwrap(), -2);
    EXPECT_EQ(reader.readU64().unwrap(), 76561197960287930ull);
    EXPECT_EQ(reader.readF32().unwrap(), 1234.5f);
    EXPECT_EQ(reader.readCString().unwrap(), "");
    EXPECT_EQ(reader.readCString().unwrap(), "Zürich – 東京");
    EXPECT_EQ(reader.remainingSize(), 0);
}

TEST(ByteBufferTest, ShortReadDoesNotMoveCursor) {
    std::vector<uint8_t> data = {1, 2, 3};
    ByteReader reader(data);

    auto res = reader.readI32();
    ASSERT_TRUE(res.isErr());
    EXPECT_EQ(res.unwrapErr(), ByteReaderError::OutOfBoundsRead);
    EXPECT_EQ(reader.position(), 0);

    EXPECT_EQ(reader.readU16().unwrap(), 0x0201);
}

TEST(ByteBufferTest, UnterminatedString) {
    std::vector<uint8_t> data = {'a', 'b', 'c'};
    ByteReader reader(data);

    auto res = reader.readCString();
    ASSERT_TRUE(res.isErr());
    EXPECT_EQ(res.unwrapErr(), ByteReaderError::UnterminatedString);
    EXPECT_EQ(reader.position(), 0);
}

TEST(ByteBufferTest, InvalidUtf8String) {
    std::vector<uint8_t> data = {'a', 0xc3, 0x28, 0};
    ByteReader reader(data);

    auto res = reader.readCString();
    ASSERT_TRUE(res.isErr());
    EXPECT_EQ(res.unwrapErr(), ByteReaderError::InvalidUtf8);
}

TEST(ByteBufferTest, EmbeddedNulIsRejected) {
    HeapByteWriter writer;
    writer.writeU8(1);

    auto res = writer.writeCString(std::string_view("ab\0cd", 5));
    ASSERT_TRUE(res.isErr());
    EXPECT_EQ(res.unwrapErr(), ByteWriterError::EmbeddedNul);
    EXPECT_EQ(writer.position(), 1);
}

TEST(ByteBufferTest, ReadToEnd) {
    std::vector<uint8_t> data = {1, 2, 3, 4, 5};
    ByteReader reader(data);
    ASSERT_TRUE(reader.skip(2).isOk());

    EXPECT_EQ(reader.readToEnd(), (std::vector<uint8_t>{3, 4, 5}));
    EXPECT_EQ(reader.remainingSize(), 0);
    EXPECT_TRUE(reader.skip(1).isErr());
}
