#include <gtest/gtest.h>
#include "registry/lookup_engine.hpp"
#include "registry/registration_service.hpp"
#include "store/file_record_store.hpp"
#include "code/code_generator.hpp"
#include "crypto/digest.hpp"
#include "test_utils.hpp"
#include <filesystem>
#include <string>

using namespace docreg::registry;
using docreg::record::DocumentRecord;
using docreg::store::FileRecordStore;

class LookupEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        quiet_logging();

        test_dir = make_test_dir("lookup_engine_test");
        store = std::make_unique<FileRecordStore>(test_dir);
        engine = std::make_unique<LookupEngine>(*store);
    }

    void TearDown() override {
        engine.reset();
        store.reset();
        std::filesystem::remove_all(test_dir);
    }

    void add(const std::string& hash_code, const std::string& owner,
             const std::string& display = "Carta de Manifestacion",
             const std::string& client = "ACME") {
        DocumentRecord record;
        record.trace_id = "0b7e3f4a-" + owner;
        record.hash_code = hash_code;
        record.short_code = docreg::code::derive_short_code(hash_code);
        record.owner_namespace = owner;
        record.document_type_display = display;
        record.client_name = client;
        record.creation_timestamp = "19/10/2026 10:15:00";
        store->put(record, false);
    }

    std::filesystem::path test_dir;
    std::unique_ptr<FileRecordStore> store;
    std::unique_ptr<LookupEngine> engine;
};

TEST_F(LookupEngineTest, ResolvesFullCode) {
    add("CM-A1B2C3D4E5F6", "alice");

    LookupResult result = engine->resolve("CM-A1B2C3D4E5F6");
    ASSERT_TRUE(result.found());
    EXPECT_EQ(result.status, LookupStatus::FOUND);
    EXPECT_EQ(result.message, "Document found and verified");
    EXPECT_EQ(result.record->owner_namespace, "alice");
}

TEST_F(LookupEngineTest, ResolvesShortCode) {
    add("CM-A1B2C3D4E5F6", "alice");

    LookupResult result = engine->resolve("ABCDEF");
    ASSERT_TRUE(result.found());
    EXPECT_EQ(result.record->hash_code, "CM-A1B2C3D4E5F6");
}

// Input is trimmed and upper-cased before matching
TEST_F(LookupEngineTest, NormalizesInput) {
    add("CM-A1B2C3D4E5F6", "alice");

    EXPECT_TRUE(engine->resolve("  cm-a1b2c3d4e5f6 ").found());
    EXPECT_TRUE(engine->resolve("abcdef\n").found());
    EXPECT_EQ(engine->resolve(" cm-a1b2c3d4e5f6").normalized_code, "CM-A1B2C3D4E5F6");
}

TEST_F(LookupEngineTest, InvalidFormat) {
    LookupResult result = engine->resolve("not-a-code");
    EXPECT_FALSE(result.found());
    EXPECT_EQ(result.status, LookupStatus::INVALID_FORMAT);
    EXPECT_EQ(result.message, "Invalid format. Use XX-XXXXXXXXXXXX (full code) or XXXXXX (short code)");

    EXPECT_EQ(engine->resolve("").status, LookupStatus::INVALID_FORMAT);
    EXPECT_EQ(engine->resolve("ABCDEFG").status, LookupStatus::INVALID_FORMAT);
    EXPECT_EQ(engine->resolve("C1-A1B2C3D4E5F6").status, LookupStatus::INVALID_FORMAT);
}

TEST_F(LookupEngineTest, NotFound) {
    add("CM-A1B2C3D4E5F6", "alice");

    LookupResult result = engine->resolve("ZZ-000000000000");
    EXPECT_EQ(result.status, LookupStatus::NOT_FOUND);
    EXPECT_FALSE(result.record.has_value());
    EXPECT_EQ(result.message, "Hash code 'ZZ-000000000000' not found in database");

    EXPECT_EQ(engine->resolve("ZZZZZZ").status, LookupStatus::NOT_FOUND);
}

// Two codes sharing a short code: the first in scan order wins
TEST_F(LookupEngineTest, ShortCodeCollisionResolvesInScanOrder) {
    add("IA-A0B0C0D0E0F0", "zed");
    add("CM-A1B2C3D4E5F6", "bob");

    LookupResult result = engine->resolve("ABCDEF");
    ASSERT_TRUE(result.found());
    EXPECT_EQ(result.record->owner_namespace, "bob");
    EXPECT_EQ(result.record->hash_code, "CM-A1B2C3D4E5F6");
}

TEST_F(LookupEngineTest, CorruptUnitDoesNotHideOthers) {
    write_text_file(test_dir / "aaa" / "metadata_CM_A1B2C3D4E5F6_broken00.json", "{\"hash_info\": ");
    add("CM-A1B2C3D4E5F6", "bob");

    LookupResult result = engine->resolve("CM-A1B2C3D4E5F6");
    ASSERT_TRUE(result.found());
    EXPECT_EQ(result.record->owner_namespace, "bob");
}

TEST_F(LookupEngineTest, EmptyStore) {
    EXPECT_EQ(engine->resolve("CM-A1B2C3D4E5F6").status, LookupStatus::NOT_FOUND);
    EXPECT_EQ(engine->search_partial("CM-").status, LookupStatus::NOT_FOUND);
}

TEST_F(LookupEngineTest, PartialSearch) {
    add("CM-A1B2C3D4E5F6", "alice");
    add("IA-A1B2XXXXXXXX", "bob", "", "");
    add("OT-999999999999", "carol");

    PartialSearchResult result = engine->search_partial("a1b2");
    EXPECT_EQ(result.status, LookupStatus::FOUND);
    EXPECT_EQ(result.query, "A1B2");
    ASSERT_EQ(result.results.size(), 2u);
    EXPECT_EQ(result.message, "2 matching documents");

    EXPECT_EQ(result.results[0].hash_code, "CM-A1B2C3D4E5F6");
    EXPECT_EQ(result.results[0].short_code, "ABCDEF");
    EXPECT_EQ(result.results[0].document_type_display, "Carta de Manifestacion");

    // Missing descriptive fields are reported as Unknown
    EXPECT_EQ(result.results[1].hash_code, "IA-A1B2XXXXXXXX");
    EXPECT_EQ(result.results[1].document_type_display, "Unknown");
    EXPECT_EQ(result.results[1].client_name, "Unknown");
}

TEST_F(LookupEngineTest, PartialSearchRequiresMinimumLength) {
    add("CM-A1B2C3D4E5F6", "alice");

    PartialSearchResult result = engine->search_partial("A1");
    EXPECT_EQ(result.status, LookupStatus::INVALID_FORMAT);
    EXPECT_TRUE(result.results.empty());
}

TEST_F(LookupEngineTest, PartialSearchHonorsLimit) {
    for (int i = 0; i < 12; ++i) {
        std::string suffix = std::to_string(100 + i);
        add("OT-AAAAAAAAA" + suffix, "user" + suffix);
    }

    EXPECT_EQ(engine->search_partial("OT-").results.size(), LookupEngine::DEFAULT_PARTIAL_LIMIT);
    EXPECT_EQ(engine->search_partial("OT-", 3).results.size(), 3u);
    EXPECT_EQ(engine->search_partial("OT-", 50).results.size(), 12u);
}

// Register through the service, then resolve by full and short code from disk
TEST_F(LookupEngineTest, RegisterThenResolveRoundTrip) {
    RegistrationService registration(*store);

    RegistrationRequest request;
    request.type_prefix = "IA";
    request.owner_namespace = "alice";
    request.client_name = "ACME";
    request.file_name = "audit.pdf";
    request.form_data["auditor"] = std::string("J. Smith");
    request.form_data["pages"] = std::int64_t{42};
    request.form_data["signed"] = true;
    request.form_data["ratio"] = 0.25;
    request.form_data["notes"] = nullptr;

    RegistrationResult registered = registration.register_content(request, "audit report body");
    ASSERT_TRUE(registered.success) << registered.message;
    const std::string hash_code = *registered.hash_code;

    auto stored = store->get_by_hash_code(hash_code);
    ASSERT_TRUE(stored.has_value());

    LookupResult by_full = engine->resolve(hash_code);
    ASSERT_TRUE(by_full.found());
    EXPECT_TRUE(*by_full.record == *stored);
    EXPECT_EQ(by_full.record->owner_namespace, "alice");
    EXPECT_EQ(by_full.record->document_type, "informe_auditoria");
    EXPECT_EQ(by_full.record->file_size, std::string("audit report body").size());
    EXPECT_TRUE(by_full.record->form_data == request.form_data);

    const std::string short_code = docreg::code::derive_short_code(hash_code);
    EXPECT_EQ(*registered.short_code, short_code);
    LookupResult by_short = engine->resolve(short_code);
    ASSERT_TRUE(by_short.found());
    EXPECT_EQ(by_short.record->short_code, short_code);
    EXPECT_EQ(by_short.record->hash_code, hash_code);
}

TEST_F(LookupEngineTest, OverwriteThenResolve) {
    RegistrationService registration(*store);

    RegistrationRequest first;
    first.hash_code = "CM-A1B2C3D4E5F6";
    first.owner_namespace = "alice";
    first.client_name = "First Client";
    ASSERT_TRUE(registration.register_content(first, "version one").success);

    RegistrationRequest second = first;
    second.owner_namespace = "bob";
    second.client_name = "Second Client";

    RegistrationResult duplicate = registration.register_content(second, "version two");
    EXPECT_EQ(duplicate.status, RegistrationStatus::ALREADY_EXISTS);
    EXPECT_EQ(engine->resolve("CM-A1B2C3D4E5F6").record->client_name, "First Client");

    second.overwrite = true;
    ASSERT_TRUE(registration.register_content(second, "version two").success);

    LookupResult result = engine->resolve("CM-A1B2C3D4E5F6");
    ASSERT_TRUE(result.found());
    EXPECT_EQ(result.record->client_name, "Second Client");
    EXPECT_EQ(result.record->owner_namespace, "bob");
    EXPECT_EQ(result.record->content_hash, docreg::crypto::sha256_hex(std::string("version two")));

    LookupResult by_short = engine->resolve("ABCDEF");
    ASSERT_TRUE(by_short.found());
    EXPECT_EQ(by_short.record->client_name, "Second Client");
}

// A file name that is not valid UTF-8 is stored, not rejected with a JSON error
TEST_F(LookupEngineTest, RegisterNonUtf8FileName) {
    RegistrationService registration(*store);

    RegistrationRequest request;
    request.hash_code = "OT-000000000042";
    request.owner_namespace = "alice";
    request.file_name = "caf\xe9.pdf";

    RegistrationResult result;
    ASSERT_NO_THROW(result = registration.register_content(request, "bytes"));
    ASSERT_TRUE(result.success) << result.message;

    LookupResult lookup = engine->resolve("OT-000000000042");
    ASSERT_TRUE(lookup.found());
    EXPECT_EQ(lookup.record->file_name.rfind("caf", 0), 0u);
    EXPECT_EQ(lookup.record->file_name.find('\xe9'), std::string::npos);
}
