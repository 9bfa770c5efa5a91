#include <catch2/catch_test_macros.hpp>

#include <chartfetch/integrity/chart_integrity_registry.h>
#include <chartfetch/integrity/chart_verifier.h>
#include <chartfetch/integrity/sha256.h>
#include <chartfetch/storage/key_value_store.h>

#include "../../support/temp_dir_scope.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace chartfetch;
using namespace chartfetch::integrity;
using chartfetch::storage::MemoryKeyValueStore;
using chartfetch::test_support::TempDirScope;

namespace {

// Memory store whose writes can be made to fail.
class FailingWritesStore final : public storage::IKeyValueStore {
public:
    bool failWrites{false};
    MemoryKeyValueStore inner;

    Result<std::optional<std::string>> get(std::string_view key) const override {
        return inner.get(key);
    }
    Result<void> set(std::string_view key, std::string_view value) override {
        if (failWrites)
            return Error{ErrorCode::IoError, "no space left on device"};
        return inner.set(key, value);
    }
    Result<void> remove(std::string_view key) override {
        if (failWrites)
            return Error{ErrorCode::IoError, "read-only file system"};
        return inner.remove(key);
    }
    std::vector<std::string> keysWithPrefix(std::string_view prefix) const override {
        return inner.keysWithPrefix(prefix);
    }
};

} // namespace

TEST_CASE("compare reports a mismatch against a seeded expectation", "[integrity][registry]") {
    MemoryKeyValueStore kv;
    ChartIntegrityRegistry registry(kv);
    registry.seed({{"A", "DEADBEEF"}});

    auto mm = registry.compare("A", "CAFEBABE");
    REQUIRE(mm.has_value());
    CHECK(mm->chartId == "A");
    CHECK(mm->expected == "DEADBEEF");
    CHECK(mm->actual == "CAFEBABE");

    CHECK_FALSE(registry.compare("A", "deadbeef").has_value());
    CHECK_FALSE(registry.compare("B", "anything").has_value());

    auto j = toJson(*mm);
    CHECK(j["chartId"] == "A");
    CHECK(j["expected"] == "DEADBEEF");
    CHECK(j["actual"] == "CAFEBABE");

    // seed() is memory only
    CHECK(kv.size() == 0);
}

TEST_CASE("captureFirstLoad never overwrites an expectation", "[integrity][registry]") {
    MemoryKeyValueStore kv;
    ChartIntegrityRegistry registry(kv);

    auto first = registry.captureFirstLoad("US5WA50M", "aaaa");
    REQUIRE(first.has_value());
    CHECK(first.value());
    CHECK(kv.get("chart_integrity_US5WA50M").value() == std::optional<std::string>{"aaaa"});

    auto second = registry.captureFirstLoad("US5WA50M", "bbbb");
    REQUIRE(second.has_value());
    CHECK_FALSE(second.value());
    CHECK(registry.get("US5WA50M")->expectedSha256 == "aaaa");

    CHECK(registry.captureFirstLoad("", "aaaa").error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("upsert replaces and writes through", "[integrity][registry]") {
    MemoryKeyValueStore kv;
    ChartIntegrityRegistry registry(kv);
    REQUIRE(registry.upsert("US5WA50M", "aaaa").has_value());
    REQUIRE(registry.upsert("US5WA50M", "bbbb").has_value());
    CHECK(registry.get("US5WA50M")->expectedSha256 == "bbbb");
    CHECK(kv.get(registry.storageKey("US5WA50M")).value() == std::optional<std::string>{"bbbb"});
    CHECK(registry.storageKey("X") == "chart_integrity_X");
}

TEST_CASE("a failed store write leaves the registry unchanged", "[integrity][registry]") {
    FailingWritesStore kv;
    ChartIntegrityRegistry registry(kv);
    REQUIRE(registry.upsert("A", "1111").has_value());

    kv.failWrites = true;

    SECTION("upsert") {
        auto r = registry.upsert("A", "2222");
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code == ErrorCode::IoError);
        CHECK(registry.get("A")->expectedSha256 == "1111");
        CHECK_FALSE(registry.compare("A", "1111").has_value());
        CHECK(kv.inner.get("chart_integrity_A").value() == std::optional<std::string>{"1111"});

        CHECK_FALSE(registry.captureFirstLoad("B", "3333").has_value());
        CHECK_FALSE(registry.get("B").has_value());
    }

    SECTION("clear keeps entries it could not remove") {
        registry.seed({{"MEMONLY", "4444"}});
        CHECK_FALSE(registry.clear().has_value());
        CHECK(registry.get("A")->expectedSha256 == "1111");
        CHECK_FALSE(registry.get("MEMONLY").has_value());
        CHECK(registry.size() == 1);
    }

    // A restart sees the same expectation memory held
    kv.failWrites = false;
    ChartIntegrityRegistry reloaded(kv);
    CHECK(reloaded.initialize() == 1);
    CHECK(reloaded.get("A")->expectedSha256 == "1111");
}

TEST_CASE("initialize loads persisted entries and skips corrupt ones", "[integrity][registry]") {
    MemoryKeyValueStore kv;
    REQUIRE(kv.set("chart_integrity_GOOD", "1111").has_value());
    REQUIRE(kv.set("unrelated_key", "2222").has_value());
    kv.putRaw("chart_integrity_BAD", nlohmann::json::array({1, 2, 3}));

    ChartIntegrityRegistry registry(kv);
    CHECK(registry.initialize() == 1);
    CHECK(registry.size() == 1);
    CHECK(registry.get("GOOD")->expectedSha256 == "1111");
    CHECK_FALSE(registry.get("BAD").has_value());
    CHECK_FALSE(registry.get("unrelated_key").has_value());
}

TEST_CASE("clear drops records and persisted keys under the prefix", "[integrity][registry]") {
    MemoryKeyValueStore kv;
    ChartIntegrityRegistry registry(kv);
    REQUIRE(registry.upsert("A", "aa").has_value());
    REQUIRE(registry.upsert("B", "bb").has_value());
    REQUIRE(kv.set("settings_theme", "dark").has_value());

    REQUIRE(registry.clear().has_value());
    CHECK(registry.size() == 0);
    CHECK(kv.keysWithPrefix("chart_integrity_").empty());
    CHECK(kv.get("settings_theme").value() == std::optional<std::string>{"dark"});

    // Nothing reappears after a reload
    ChartIntegrityRegistry reloaded(kv);
    CHECK(reloaded.initialize() == 0);
}

TEST_CASE("persisted expectations survive a restart", "[integrity][registry]") {
    auto tmp = TempDirScope::unique_under("chartfetch-registry");
    const auto file = tmp / "integrity.json";
    {
        auto kv = storage::makeJsonFileKeyValueStore(file);
        ChartIntegrityRegistry registry(*kv);
        REQUIRE(registry.captureFirstLoad("US5WA50M", "abcd").has_value());
    }
    auto kv = storage::makeJsonFileKeyValueStore(file);
    ChartIntegrityRegistry registry(*kv);
    REQUIRE(registry.initialize() == 1);
    CHECK(registry.compare("US5WA50M", "ffff").has_value());
}

TEST_CASE("verifyChartFile walks first load, verified and mismatch", "[integrity][verifier]") {
    auto tmp = TempDirScope::unique_under("chartfetch-verify");
    MemoryKeyValueStore kv;
    ChartIntegrityRegistry registry(kv);
    const auto payload = test_support::make_payload(512);
    test_support::write_file(tmp / "US5WA50M.000", payload);
    const auto digest = sha256Hex(payload);

    auto first = verifyChartFile(registry, "US5WA50M", tmp / "US5WA50M.000");
    REQUIRE(first.has_value());
    CHECK(first.value().status == VerificationStatus::FirstLoadCaptured);
    CHECK(first.value().computedSha256 == digest);

    auto again = verifyChartFile(registry, "US5WA50M", tmp / "US5WA50M.000");
    REQUIRE(again.has_value());
    CHECK(again.value().status == VerificationStatus::Verified);
    CHECK_FALSE(again.value().mismatch.has_value());

    test_support::write_file(tmp / "US5WA50M.000", test_support::make_payload(512, 9));
    auto changed = verifyChartFile(registry, "US5WA50M", tmp / "US5WA50M.000");
    REQUIRE(changed.has_value());
    CHECK(changed.value().status == VerificationStatus::Mismatch);
    REQUIRE(changed.value().mismatch.has_value());
    CHECK(changed.value().mismatch->expected == digest);

    auto missing = verifyChartFile(registry, "US5WA50M", tmp / "gone.000");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == ErrorCode::FileNotFound);
}
