/**
 * @file test_state_store.cpp
 * @brief Unit tests for the locked state file
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <timeuuid/core/errors.hpp>
#include <timeuuid/core/node_identity.hpp>
#include <timeuuid/core/state_store.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

using namespace timeuuid::core;
using ::testing::Return;

namespace {

class MockNodeIdentity : public NodeIdentityProvider {
public:
    MOCK_METHOD(uint64_t, resolve, (), (override));
};

std::vector<uint8_t> readBytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void writeBytes(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

}  // namespace

class StateStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/timeuuid-state-XXXXXX";
        char* dir = ::mkdtemp(tmpl);
        ASSERT_NE(dir, nullptr);
        dir_ = dir;
        path_ = dir_ + "/state";
    }

    void TearDown() override {
        std::remove(path_.c_str());
        ::rmdir(dir_.c_str());
    }

    std::string dir_;
    std::string path_;
};

// =============================================================================
// Record encoding
// =============================================================================

TEST(StateRecordTest, LittleEndianLayout) {
    StateRecord record;
    record.node = 0x0123456789ABULL;
    record.sequence = 0x11223344;
    record.last_clock = 0x0102030405060708ULL;

    auto bytes = encodeStateRecord(record);
    ASSERT_EQ(bytes.size(), kStateRecordSize);

    std::vector<uint8_t> expected = {
        0x23, 0x01,                                      // node high
        0xAB, 0x89, 0x67, 0x45,                          // node low
        0x44, 0x33, 0x22, 0x11,                          // sequence
        0x08, 0x07, 0x06, 0x05, 0x04, 0x03, 0x02, 0x01,  // last clock
    };
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(bytes[i], expected[i]) << "byte " << i;
    }
    for (size_t i = kStateRecordPayload; i < kStateRecordSize; ++i) {
        EXPECT_EQ(bytes[i], 0) << "byte " << i;
    }

    StateRecord decoded = decodeStateRecord(bytes.data(), bytes.size());
    EXPECT_EQ(decoded.node, record.node);
    EXPECT_EQ(decoded.sequence, record.sequence);
    EXPECT_EQ(decoded.last_clock, record.last_clock);
}

TEST(StateRecordTest, DecodeAcceptsPayloadOnly) {
    StateRecord record;
    record.node = 7;
    record.sequence = 9;
    auto bytes = encodeStateRecord(record);
    EXPECT_EQ(decodeStateRecord(bytes.data(), kStateRecordPayload).sequence, 9u);
}

TEST(StateRecordTest, DecodeRejectsShortInput) {
    std::vector<uint8_t> bytes(kStateRecordPayload - 1, 0);
    EXPECT_THROW(decodeStateRecord(bytes.data(), bytes.size()), PersistenceUnavailableError);
}

// =============================================================================
// File operations
// =============================================================================

TEST_F(StateStoreTest, InitializeCreatesRecord) {
    MockNodeIdentity identity;
    EXPECT_CALL(identity, resolve()).WillOnce(Return(0x0A0B0C0D0E0FULL));

    StateStore store(path_);
    EXPECT_FALSE(store.exists());

    StateRecord record = store.initialize(identity, 0x1230);
    EXPECT_EQ(record.node, 0x0A0B0C0D0E0FULL);
    EXPECT_LE(record.sequence, 0xFFFFu);
    EXPECT_EQ(record.last_clock, 0x1230u);

    EXPECT_TRUE(store.exists());
    EXPECT_EQ(readBytes(path_).size(), kStateRecordSize);

    StateRecord stored = store.read();
    EXPECT_EQ(stored.node, record.node);
    EXPECT_EQ(stored.sequence, record.sequence);
}

TEST_F(StateStoreTest, InitializeAppliesFileMode) {
    MockNodeIdentity identity;
    EXPECT_CALL(identity, resolve()).WillOnce(Return(1));

    mode_t old_mask = ::umask(0);
    StateStore store(path_, 0600);
    store.initialize(identity, 0);
    ::umask(old_mask);

    struct stat st;
    ASSERT_EQ(::stat(path_.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
}

TEST_F(StateStoreTest, SecondInitializeIncrementsSequence) {
    MockNodeIdentity identity;
    EXPECT_CALL(identity, resolve()).Times(1).WillOnce(Return(0x42));

    StateStore store(path_);
    StateRecord first = store.initialize(identity, 0);
    StateRecord second = store.initialize(identity, 0x10);

    EXPECT_EQ(second.node, first.node);
    EXPECT_EQ(second.sequence, first.sequence + 1);
    EXPECT_EQ(second.last_clock, 0x10u);
}

TEST_F(StateStoreTest, RolloverIncrementsStoredSequence) {
    StateRecord seed;
    seed.node = 0x99;
    seed.sequence = 100;
    auto bytes = encodeStateRecord(seed);
    writeBytes(path_, std::vector<uint8_t>(bytes.begin(), bytes.end()));

    StateStore store(path_);
    StateRecord fallback;
    fallback.node = 0x55;
    fallback.sequence = 5;

    StateRecord record = store.rollover(fallback, 0x20);
    EXPECT_EQ(record.node, 0x99u);
    EXPECT_EQ(record.sequence, 101u);
    EXPECT_EQ(store.read().sequence, 101u);
}

TEST_F(StateStoreTest, RolloverRecreatesMissingFile) {
    StateStore store(path_);
    StateRecord fallback;
    fallback.node = 0x55;
    fallback.sequence = 5;

    StateRecord record = store.rollover(fallback, 0x30);
    EXPECT_EQ(record.node, 0x55u);
    EXPECT_EQ(record.sequence, 6u);
    EXPECT_EQ(record.last_clock, 0x30u);
    EXPECT_TRUE(store.exists());
}

TEST_F(StateStoreTest, ShortRecordIsRejected) {
    writeBytes(path_, std::vector<uint8_t>(10, 0xFF));

    MockNodeIdentity identity;
    EXPECT_CALL(identity, resolve()).Times(0);

    StateStore store(path_);
    EXPECT_THROW(store.initialize(identity, 0), PersistenceUnavailableError);
    EXPECT_THROW(store.rollover(StateRecord{}, 0), PersistenceUnavailableError);
    EXPECT_THROW(store.read(), PersistenceUnavailableError);
}

TEST_F(StateStoreTest, UnwritableLocationIsReported) {
    MockNodeIdentity identity;
    EXPECT_CALL(identity, resolve()).Times(0);

    StateStore store(dir_ + "/missing-dir/state");
    EXPECT_THROW(store.initialize(identity, 0), PersistenceUnavailableError);
}

TEST_F(StateStoreTest, ReadMissingFileThrows) {
    StateStore store(path_);
    EXPECT_THROW(store.read(), PersistenceUnavailableError);
}

TEST_F(StateStoreTest, NodeFailureLeavesNoRecordBehind) {
    MockNodeIdentity identity;
    EXPECT_CALL(identity, resolve()).WillOnce(
        ::testing::Throw(NodeIdentityUnavailableError("no interface")));

    StateStore store(path_);
    EXPECT_THROW(store.initialize(identity, 0), NodeIdentityUnavailableError);
    EXPECT_FALSE(store.exists());
}

TEST(StateStoreDefaultsTest, DefaultPathNamesTimeuuid) {
    std::string path = StateStore::defaultPath();
    EXPECT_NE(path.find("timeuuid"), std::string::npos);
}

TEST(StateStoreDefaultsTest, RandomSequenceFitsSixteenBits) {
    for (int i = 0; i < 1000; ++i) {
        EXPECT_LE(StateStore::randomSequence(), 0xFFFFu);
    }
}
