#include <catch2/catch_test_macros.hpp>
#include "ari/audit.hpp"
#include "ari/checkpoint.hpp"
#include "ari/integrity.hpp"
#include "test_support.hpp"
#include <fstream>

using namespace ari;
using ari::testing::InMemoryLineStore;
using ari::testing::TempDir;

namespace
{
    AuditDraft event(const std::string &action, int n)
    {
        AuditDraft d;
        d.action = action;
        d.actor = "operator-1";
        d.trust_level = TrustLevel::Operator;
        d.details = nlohmann::json{{"n", n}};
        return d;
    }

    struct Fixture
    {
        std::shared_ptr<InMemoryLineStore> entries = std::make_shared<InMemoryLineStore>();
        std::shared_ptr<InMemoryLineStore> cps = std::make_shared<InMemoryLineStore>();
        AuditChain chain{entries};
        std::unique_ptr<CheckpointManager> manager;
        std::unique_ptr<IntegrityVerifier> verifier;

        Fixture()
        {
            CheckpointPolicy never;
            never.every_entries = 0;
            never.every_seconds = std::chrono::seconds(0);
            manager = CheckpointManager::create(chain, cps, testing::test_key(), never).value();
            verifier = std::make_unique<IntegrityVerifier>(chain, *manager);
        }

        void append(int count, const std::string &action = "write")
        {
            for (int i = 0; i < count; ++i)
                REQUIRE(chain.append(event(action, i)).has_value());
        }

        /** Rewrite one stored record out of band */
        void edit_line(std::size_t index, const std::function<void(nlohmann::json &)> &edit)
        {
            auto lines = entries->lines();
            auto j = nlohmann::json::parse(lines.at(index));
            edit(j);
            lines[index] = j.dump();
            entries->set_lines(lines);
        }
    };
}

TEST_CASE("Untouched chain verifies", "[integrity][chain]")
{
    Fixture f;
    f.append(8);

    auto result = f.verifier->verify_chain();
    REQUIRE(result.has_value());
    REQUIRE(result->valid);
    REQUIRE(result->entries_checked == 8);
    REQUIRE_FALSE(result->broken_at_sequence.has_value());
}

TEST_CASE("Editing details out of band breaks the chain at that entry", "[integrity][chain][tamper]")
{
    Fixture f;
    f.append(6);

    f.edit_line(3, [](nlohmann::json &j)
                { j["details"]["n"] = 999; });

    auto result = f.verifier->verify_chain();
    REQUIRE(result.has_value());
    REQUIRE_FALSE(result->valid);
    REQUIRE(result->broken_at_sequence == std::optional<std::uint64_t>(3));
    REQUIRE(result->entries_checked == 3);
    REQUIRE(result->details.find("Hash mismatch") != std::string::npos);

    // The verifier reads the store, not the appender's index
    REQUIRE(f.chain.entry(3)->details["n"] == 3);
}

TEST_CASE("Editing a hash is caught by the next entry's link", "[integrity][chain][tamper]")
{
    Fixture f;
    f.append(4);

    // Recompute entry 1 consistently so only the link to entry 2 breaks
    f.edit_line(1, [](nlohmann::json &j)
                {
        j["actor"] = "mallory";
        auto entry = AuditEntry::from_json(j).value();
        j["hash"] = entry.compute_hash().value(); });

    auto result = f.verifier->verify_chain();
    REQUIRE(result.has_value());
    REQUIRE_FALSE(result->valid);
    REQUIRE(result->broken_at_sequence == std::optional<std::uint64_t>(2));
    REQUIRE(result->details.find("prevHash") != std::string::npos);
}

TEST_CASE("A removed entry is reported as a sequence gap", "[integrity][chain][tamper]")
{
    Fixture f;
    f.append(5);

    auto lines = f.entries->lines();
    lines.erase(lines.begin() + 2);
    f.entries->set_lines(lines);

    auto result = f.verifier->verify_chain();
    REQUIRE(result.has_value());
    REQUIRE_FALSE(result->valid);
    REQUIRE(result->broken_at_sequence == std::optional<std::uint64_t>(2));
    REQUIRE(result->details.find("Sequence gap") != std::string::npos);
}

TEST_CASE("Truncate-and-regrow passes the chain check but fails the checkpoint check", "[integrity][checkpoint][rollback]")
{
    Fixture f;
    f.append(10, "original");
    auto cp = f.manager->checkpoint_now();
    REQUIRE(cp.has_value());
    REQUIRE(cp->has_value());
    REQUIRE((*cp)->at_sequence == 9);

    auto before = f.verifier->verify_checkpoints();
    REQUIRE(before.has_value());
    REQUIRE(before->valid);
    REQUIRE(before->checked == 1);

    // Roll the store back to 5 entries and regrow it with different content
    auto lines = f.entries->lines();
    lines.resize(5);
    f.entries->set_lines(lines);
    REQUIRE(f.chain.load().has_value());
    f.append(5, "forged");

    auto chain = f.verifier->verify_chain();
    REQUIRE(chain.has_value());
    REQUIRE(chain->valid);
    REQUIRE(chain->entries_checked == 10);

    auto checkpoints = f.verifier->verify_checkpoints();
    REQUIRE(checkpoints.has_value());
    REQUIRE_FALSE(checkpoints->valid);
    REQUIRE(checkpoints->mismatches.size() == 1);
    const auto &m = checkpoints->mismatches[0];
    REQUIRE(m.at_sequence == 9);
    REQUIRE(m.field == "tipHash");
    REQUIRE(m.expected == (*cp)->tip_hash);
    REQUIRE(m.actual == f.chain.tip_hash());
}

TEST_CASE("Truncation below a checkpoint reports the tip as missing", "[integrity][checkpoint][rollback]")
{
    Fixture f;
    f.append(6);
    REQUIRE(f.manager->checkpoint_now().has_value());

    auto lines = f.entries->lines();
    lines.resize(3);
    f.entries->set_lines(lines);

    auto chain = f.verifier->verify_chain();
    REQUIRE(chain.has_value());
    REQUIRE(chain->valid);

    auto checkpoints = f.verifier->verify_checkpoints();
    REQUIRE(checkpoints.has_value());
    REQUIRE_FALSE(checkpoints->valid);
    REQUIRE(checkpoints->mismatches.size() == 1);
    REQUIRE(checkpoints->mismatches[0].field == "tipHash");
    REQUIRE(checkpoints->mismatches[0].actual == "<missing>");
}

TEST_CASE("A forged checkpoint signature is reported", "[integrity][checkpoint][signature]")
{
    Fixture f;
    f.append(3);
    REQUIRE(f.manager->checkpoint_now().has_value());

    auto cp_lines = f.cps->lines();
    auto j = nlohmann::json::parse(cp_lines.at(0));
    auto sig = j["signature"].get<std::string>();
    sig[0] = sig[0] == 'a' ? 'b' : 'a';
    j["signature"] = sig;
    f.cps->set_lines({j.dump()});

    auto result = f.verifier->verify_checkpoints();
    REQUIRE(result.has_value());
    REQUIRE_FALSE(result->valid);
    REQUIRE(result->mismatches.size() == 1);
    REQUIRE(result->mismatches[0].field == "signature");
    REQUIRE(result->mismatches[0].actual == sig);
    // The correct tag is never disclosed in the report
    REQUIRE(result->mismatches[0].expected.find(j["tipHash"].get<std::string>()) != std::string::npos);
}

TEST_CASE("In-place tampering before a checkpoint also fails the checkpoint check", "[integrity][checkpoint][tamper]")
{
    Fixture f;
    f.append(4);
    REQUIRE(f.manager->checkpoint_now().has_value());

    f.edit_line(0, [](nlohmann::json &j)
                { j["action"] = "rewritten"; });

    auto result = f.verifier->verify_checkpoints();
    REQUIRE(result.has_value());
    REQUIRE_FALSE(result->valid);
    REQUIRE(result->mismatches[0].field == "tipHash");
    REQUIRE(result->mismatches[0].at_sequence == 3);
}

TEST_CASE("Unreadable or corrupt stores mean integrity unknown", "[integrity][storage]")
{
    Fixture f;
    f.append(2);

    SECTION("Store read failure")
    {
        f.entries->set_unreadable(true);
        auto chain = f.verifier->verify_chain();
        REQUIRE_FALSE(chain.has_value());
        REQUIRE(chain.error().code == ErrorCode::StorageError);

        auto all = f.verifier->verify_all();
        REQUIRE_FALSE(all.has_value());
    }

    SECTION("Corrupt record encoding")
    {
        auto lines = f.entries->lines();
        lines[1] = "{\"sequence\":1,";
        f.entries->set_lines(lines);
        auto chain = f.verifier->verify_chain();
        REQUIRE_FALSE(chain.has_value());
        REQUIRE(chain.error().code == ErrorCode::ParsingError);
    }

    SECTION("Corrupt checkpoint store")
    {
        f.cps->set_lines({"garbage"});
        auto checkpoints = f.verifier->verify_checkpoints();
        REQUIRE_FALSE(checkpoints.has_value());
        REQUIRE(checkpoints.error().code == ErrorCode::ParsingError);
    }
}

TEST_CASE("verify_all bundles both checks", "[integrity][report]")
{
    Fixture f;
    f.append(4);
    REQUIRE(f.manager->checkpoint_now().has_value());

    auto report = f.verifier->verify_all();
    REQUIRE(report.has_value());
    REQUIRE(report->valid());
    REQUIRE(report->entry_count == 4);
    REQUIRE(report->checkpoint_count == 1);

    auto j = report->to_json();
    REQUIRE(j["valid"] == true);
    REQUIRE(j["chain"]["brokenAtSequence"].is_null());
    REQUIRE(j["checkpoints"]["checked"] == 1);
}

TEST_CASE("Verification reads files written by the appender", "[integrity][file]")
{
    TempDir dir;
    const auto path = dir.file("audit.jsonl");
    AuditChain chain(std::make_shared<FileLineStore>(path));
    auto manager = CheckpointManager::create(chain, std::make_shared<FileLineStore>(path + ".checkpoints"),
                                             testing::test_key());
    REQUIRE(manager.has_value());
    for (int i = 0; i < 3; ++i)
        REQUIRE(chain.append(event("file", i)).has_value());
    REQUIRE((*manager)->checkpoint_now().has_value());

    IntegrityVerifier verifier(chain, **manager);
    REQUIRE(verifier.verify_all().value().valid());

    // Replace the file with a tampered copy
    auto lines = chain.read_persisted().value();
    lines[1].details["n"] = 42;
    {
        std::ofstream out(path, std::ios::trunc);
        for (const auto &e : lines)
            out << e.to_json().dump() << "\n";
    }

    auto report = verifier.verify_all();
    REQUIRE(report.has_value());
    REQUIRE_FALSE(report->valid());
    REQUIRE(report->chain.broken_at_sequence == std::optional<std::uint64_t>(1));
}
