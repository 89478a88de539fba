// Tests for playbook matching and snippet formatting.

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

#include <beacon/retrieval/playbook_adapter.h>

#include "../../common/test_helpers_catch2.h"

using namespace beacon::retrieval;
using Catch::Approx;

namespace {
constexpr std::chrono::milliseconds kTimeout{1000};

const Playbook& byId(const std::vector<Playbook>& table, const std::string& id) {
    for (const auto& pb : table) {
        if (pb.id == id) {
            return pb;
        }
    }
    throw std::out_of_range(id);
}
} // namespace

TEST_CASE("PlaybookAdapter scores title tokens, keywords and context",
          "[retrieval][playbook][catch2]") {
    const auto table = PlaybookAdapter::defaultTable();
    const auto& network = byId(table, "playbook-2");

    CHECK(PlaybookAdapter::matchScore(network, "network timeout", {}) == Approx(0.4 + 0.2 + 0.2));
    CHECK(PlaybookAdapter::matchScore(network, "network timeout", {"firewall rules changed"}) ==
          Approx(0.9));
    CHECK(PlaybookAdapter::matchScore(network, "zzz", {}) == 0.0f);
}

TEST_CASE("PlaybookAdapter search returns formatted evidence", "[retrieval][playbook][catch2]") {
    PlaybookAdapter adapter(kTimeout);
    auto results = adapter.search("network timeout", {}, 5, {});

    REQUIRE(results.size() == 1);
    const auto& e = results[0];
    CHECK(e.source == "playbook#playbook-2");
    CHECK(e.sourceType == SourceType::Playbook);
    CHECK(e.score == Approx(0.8));
    CHECK(e.confidence == Approx(0.9));
    CHECK(e.recencyBoost == Approx(0.05));
    REQUIRE(e.url.has_value());
    CHECK(*e.url == "https://playbooks.example.com/playbook-2");
    CHECK(e.snippet == "Playbook: Network Connectivity Issues - Steps: Test basic connectivity "
                       "with ping; Check port availability with telnet; Review firewall rules; "
                       "... (5 total steps)");
    CHECK(e.provenance.at("difficulty") == "beginner");
    CHECK(e.provenance.at("estimated_time") == "15-30 minutes");
    CHECK(e.provenance.at("category") == "network");
}

TEST_CASE("PlaybookAdapter snippet lists short procedures fully",
          "[retrieval][playbook][catch2]") {
    Playbook pb{"pb", "Short", {"short"}, {"one", "two"}, "misc", "beginner", "5 minutes"};
    CHECK(PlaybookAdapter::formatSnippet(pb) == "Playbook: Short - Steps: one; two");
}

TEST_CASE("PlaybookAdapter category filter applies before scoring",
          "[retrieval][playbook][catch2]") {
    PlaybookAdapter adapter(kTimeout);
    CHECK(adapter.search("network timeout", {}, 5, {{"category", "database"}}).empty());
    CHECK(adapter.search("network timeout", {}, 5, {{"category", "network"}}).size() == 1);
}

TEST_CASE("PlaybookAdapter weights procedural queries", "[retrieval][playbook][catch2]") {
    PlaybookAdapter adapter(kTimeout);
    CHECK(adapter.scoreWeight({"how do I drain a node", {}}) == Approx(1.1));
    CHECK(adapter.scoreWeight({"node metrics", {}}) == Approx(1.0));
}

TEST_CASE("PlaybookAdapter loads a table from JSON", "[retrieval][playbook][catch2]") {
    auto dir = beacon::test::make_temp_dir();
    auto path = beacon::test::write_file(dir / "playbooks.json", R"([
        {"id": "pb-cert", "title": "Certificate Rotation", "keywords": ["certificate", "tls"],
         "steps": ["Issue", "Deploy", "Verify"], "category": "security"}
    ])");

    auto table = PlaybookAdapter::loadTable(path);
    REQUIRE(table);
    REQUIRE(table.value().size() == 1);
    CHECK(table.value()[0].difficulty == "unknown");

    PlaybookAdapter adapter(table.value(), kTimeout);
    auto results = adapter.search("rotate tls certificate", {}, 5, {});
    REQUIRE(results.size() == 1);
    CHECK(results[0].score == Approx(0.4 + 0.2 + 0.2));
    std::filesystem::remove_all(dir);
}
