#undef NDEBUG
#include "pattern_registry.hpp"
#include "entropy.hpp"
#include "line_decoder.hpp"
#include "compact_log.hpp"
#include "test_support.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <algorithm>

using namespace leakscan;

namespace {

const RegexPattern* find_rule(const PatternRegistry& registry, std::string_view rule_id) {
    for (const auto& p : registry.patterns()) {
        if (p.rule_id == rule_id) return &p;
    }
    return nullptr;
}

} // namespace

void test_helpers() {
    std::cout << "Testing entropy and line splitting...\n\n";

    // Test 1: Shannon entropy
    {
        assert(shannon_entropy("") == 0.0);
        assert(shannon_entropy(std::string(40, 'a')) == 0.0);
        assert(std::fabs(shannon_entropy("ab") - 1.0) < 1e-9);
        assert(std::fabs(shannon_entropy("abcd") - 2.0) < 1e-9);
        std::string all;
        for (int i = 0; i < 256; ++i) all += static_cast<char>(i);
        assert(std::fabs(shannon_entropy(all) - 8.0) < 1e-9);
        std::cout << "✓ Test 1 passed: Shannon entropy\n";
    }

    // Test 2: Line decoder numbering and terminators
    {
        LineDecoder lines("one\r\ntwo\n\nfour\n");
        std::string_view line;
        std::vector<std::string> got;
        while (lines.next(line)) got.emplace_back(line);
        assert(got.size() == 4);
        assert(got[0] == "one");
        assert(got[1] == "two");
        assert(got[2].empty());
        assert(got[3] == "four");
        assert(lines.line_number() == 4);

        LineDecoder empty("");
        assert(!empty.next(line));
        std::cout << "✓ Test 2 passed: Line decoder numbering and terminators\n";
    }
}

void test_builtin_layer() {
    std::cout << "\nTesting builtin patterns...\n\n";

    // Test 3: Every builtin compiles
    {
        auto registry = PatternRegistry::create(RegistrySources{});
        assert(registry.has_value());
        assert(registry->size() == RegistrySources::builtin_patterns().size());
        assert(registry->size() >= 27);
        for (const auto& p : registry->patterns()) assert(p.origin == PatternOrigin::Builtin);

        const auto* aws = find_rule(*registry, "aws-access-key-id");
        assert(aws != nullptr);
        assert(aws->severity == Severity::High);
        std::cout << "✓ Test 3 passed: Every builtin compiles\n";
    }

    // Test 4: A broken builtin fails construction
    {
        RegistrySources sources;
        sources.builtin.push_back({"broken", "Broken", "([a-z", Severity::High, {}, 0.0, 0, 0});
        auto registry = PatternRegistry::create(sources);
        assert(!registry.has_value());
        assert(registry.error().error == RegistryError::BuiltinPatternInvalid);
        assert(registry.error().message.find("broken") != std::string::npos);
        std::cout << "✓ Test 4 passed: A broken builtin fails construction\n";
    }

    // Test 5: (?i) prefix compiles case-insensitive
    {
        auto compiled = PatternRegistry::compile({"ci", "", "(?i)secret", Severity::Low, {}, 0.0, 0, 0},
                                                 PatternOrigin::Custom);
        assert(compiled.has_value());
        assert(re2::RE2::PartialMatch("my SeCrEt here", *compiled->regex));
        assert(compiled->source == "(?i)secret");

        auto strict = PatternRegistry::compile({"cs", "", "secret", Severity::Low, {}, 0.0, 0, 0},
                                               PatternOrigin::Custom);
        assert(strict.has_value());
        assert(!re2::RE2::PartialMatch("my SeCrEt here", *strict->regex));
        std::cout << "✓ Test 5 passed: (?i) prefix compiles case-insensitive\n";
    }
}

void test_pattern_documents() {
    std::cout << "\nTesting pattern documents...\n\n";

    // Test 6: Both document shapes, field mapping and defaults
    {
        auto specs = PatternRegistry::parse_pattern_document(
            R"([{"rule_id": "a", "pattern": "x+", "severity": "critical", "keywords": ["k"],
                 "entropy": 3.5, "max_finds": 2, "line_length": 100}])", "array");
        assert(specs.size() == 1);
        assert(specs[0].rule_id == "a");
        assert(specs[0].description == "a");
        assert(specs[0].severity == Severity::Critical);
        assert(specs[0].keywords == std::vector<std::string>{"k"});
        assert(specs[0].entropy_threshold == 3.5);
        assert(specs[0].max_finds_per_rule == 2);
        assert(specs[0].max_line_length == 100);

        auto wrapped = PatternRegistry::parse_pattern_document(
            R"({"patterns": [{"rule_id": "b", "pattern": "y"}]})", "object");
        assert(wrapped.size() == 1);
        assert(wrapped[0].severity == Severity::Medium);
        assert(wrapped[0].entropy_threshold == 0.0);
        assert(wrapped[0].max_finds_per_rule == 0);
        std::cout << "✓ Test 6 passed: Both document shapes, field mapping and defaults\n";
    }

    // Test 7: Invalid records are dropped, valid neighbours kept
    {
        auto specs = PatternRegistry::parse_pattern_document(R"([
            {"rule_id": "ok1", "pattern": "a"},
            {"pattern": "no id"},
            {"rule_id": "bad-severity", "pattern": "b", "severity": "URGENT"},
            {"rule_id": "bad-count", "pattern": "c", "max_finds": -1},
            {"rule_id": "bad-entropy", "pattern": "d", "entropy": "high"},
            "not an object",
            {"rule_id": "ok2", "pattern": "e"}
        ])", "mixed");
        assert(specs.size() == 2);
        assert(specs[0].rule_id == "ok1");
        assert(specs[1].rule_id == "ok2");

        assert(PatternRegistry::parse_pattern_document("{not json", "broken").empty());
        assert(PatternRegistry::parse_pattern_document(R"({"rules": []})", "wrong key").empty());
        std::cout << "✓ Test 7 passed: Invalid records are dropped, valid neighbours kept\n";
    }
}

void test_layering() {
    std::cout << "\nTesting registry layering...\n\n";
    testing::TempDir dir;

    // Test 8: builtin, custom, extended in order; bad regex skipped
    {
        testing::write_file(dir / "custom.json", R"({"patterns": [
            {"rule_id": "internal-token", "pattern": "itok_[0-9a-f]{16}", "severity": "HIGH"},
            {"rule_id": "bad-regex", "pattern": "([unclosed"}
        ]})");

        auto assets = std::make_shared<MemoryAssetProvider>();
        assets->add(std::string(PatternRegistry::kExtendedCatalogAsset),
                    R"([{"rule_id": "extended-rule", "pattern": "ext_[0-9]{4}", "severity": "LOW"}])");

        RegistrySources sources;
        sources.custom_file = dir / "custom.json";
        sources.assets = assets;
        auto registry = PatternRegistry::create(sources);
        assert(registry.has_value());

        const size_t builtins = RegistrySources::builtin_patterns().size();
        assert(registry->size() == builtins + 2);
        const auto& patterns = registry->patterns();
        assert(patterns[builtins].rule_id == "internal-token");
        assert(patterns[builtins].origin == PatternOrigin::Custom);
        assert(patterns[builtins + 1].rule_id == "extended-rule");
        assert(patterns[builtins + 1].origin == PatternOrigin::Extended);
        assert(find_rule(*registry, "bad-regex") == nullptr);
        std::cout << "✓ Test 8 passed: builtin, custom, extended in order; bad regex skipped\n";
    }

    // Test 9: Missing custom file and missing catalog are not errors
    {
        RegistrySources sources;
        sources.custom_file = dir / "does-not-exist.json";
        sources.assets = std::make_shared<DirectoryAssetProvider>(dir / "no-assets");
        auto registry = PatternRegistry::create(sources);
        assert(registry.has_value());
        assert(registry->size() == RegistrySources::builtin_patterns().size());
        std::cout << "✓ Test 9 passed: Missing custom file and missing catalog are not errors\n";
    }

    // Test 10: Shipped extended catalog compiles completely
    {
        auto provider = std::make_shared<DirectoryAssetProvider>(LEAKSCAN_TEST_ASSET_DIR);
        auto text = provider->read(PatternRegistry::kExtendedCatalogAsset);
        assert(text.has_value());
        auto specs = PatternRegistry::parse_pattern_document(*text, "shipped catalog");
        assert(!specs.empty());

        RegistrySources sources;
        sources.assets = provider;
        auto registry = PatternRegistry::create(sources);
        assert(registry.has_value());
        assert(registry->size() == RegistrySources::builtin_patterns().size() + specs.size());
        std::cout << "✓ Test 10 passed: Shipped extended catalog compiles completely\n";
    }
}

int main() {
    compact::Log::set_level(compact::Level::Error);
    test_helpers();
    test_builtin_layer();
    test_pattern_documents();
    test_layering();
    std::cout << "\nAll pattern registry tests passed.\n";
    return 0;
}
