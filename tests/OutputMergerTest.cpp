// =================================================================
// tests/OutputMergerTest.cpp
// =================================================================
// Unit tests for OutputMerger merging, conflicts and diagnostics.

#include "Cortex/OutputMerger.hpp"
#include "Cortex/ResponseJson.hpp"
#include "Cortex/Logger.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <cassert>
#include <cmath>
#include <chrono>
#include <limits>

namespace {

bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

} // anonymous namespace

class OutputMergerTest {
private:
    Cortex::OutputMerger m_merger;

public:
    OutputMergerTest() {
        Cortex::Logger::getInstance().setConsoleLogLevel(Cortex::LogLevel::ERROR);
    }

    void testSimilarity() {
        std::cout << "Testing similarity..." << std::endl;

        assert(m_merger.isSimilar("fix the null pointer bug", "fix the null pointer issue") &&
               "Jaccard 4/6 is above the threshold");
        assert(!m_merger.isSimilar("fix nulls", "optimize database indexes"));
        assert(m_merger.isSimilar("Fix The Bug", "fix the bug") && "Case-insensitive");
        assert(!m_merger.isSimilar("a b c d e", "a b c f g") && "Jaccard 3/7 is below the threshold");
        assert(!m_merger.isSimilar("", "") && "Two empty texts share no words");

        Cortex::MergerConfig loose;
        loose.similarity_threshold = 0.3;
        Cortex::OutputMerger loose_merger(loose);
        assert(loose_merger.isSimilar("a b c d e", "a b c f g") && "Threshold is configurable");

        std::cout << "✓ Similarity test passed" << std::endl;
    }

    void testConflictDetection() {
        std::cout << "Testing conflict detection..." << std::endl;

        Cortex::WorkerOutput yes("a", "The answer is yes", 0.9);
        Cortex::WorkerOutput no("b", "The answer is no", 0.5);
        assert(Cortex::OutputMerger::isConflicting(yes, no));
        assert(!Cortex::OutputMerger::isConflicting(no, yes) && "Check is directional");

        Cortex::WorkerOutput always("c", "ALWAYS validate input", 0.7);
        Cortex::WorkerOutput never("d", "Never validate input", 0.6);
        assert(Cortex::OutputMerger::isConflicting(always, never));

        Cortex::WorkerOutput must("e", "You must lock first", 0.7);
        Cortex::WorkerOutput must_not("f", "You must not lock first", 0.6);
        assert(Cortex::OutputMerger::isConflicting(must, must_not));

        Cortex::WorkerOutput know("g", "I know the answer", 0.6);
        assert(Cortex::OutputMerger::isConflicting(yes, know) && "Substring match: 'know' contains 'no'");

        Cortex::WorkerOutput plain("h", "Use a mutex here", 0.6);
        assert(!Cortex::OutputMerger::isConflicting(plain, plain));

        // Pairs are checked in input order: the earlier output must carry the affirmative marker
        auto conflicts = m_merger.identifyConflicts({yes, plain, no});
        assert(conflicts.size() == 1);
        assert(conflicts[0].first.source == "a" && conflicts[0].second.source == "b");
        assert(m_merger.identifyConflicts({no, plain, yes}).empty() && "Reversed order is not flagged");

        assert(m_merger.identifyConflicts({}).empty());
        assert(m_merger.identifyConflicts({yes}).empty());

        std::cout << "✓ Conflict detection test passed" << std::endl;
    }

    void testConflictResolution() {
        std::cout << "Testing advisory conflict resolution..." << std::endl;

        Cortex::WorkerOutput yes("a", "The answer is yes", 0.9);
        Cortex::WorkerOutput no("b", "The answer is no", 0.5);

        auto resolution = Cortex::OutputMerger::resolveConflict({yes, no});
        assert(resolution.preferred_source == "a" && "Higher quality preferred");
        assert(resolution.other_source == "b");
        assert(near(resolution.preferred_quality, 0.9));

        Cortex::WorkerOutput tie_first("x", "yes", 0.7);
        Cortex::WorkerOutput tie_second("y", "no", 0.7);
        auto tie = Cortex::OutputMerger::resolveConflict({tie_first, tie_second});
        assert(tie.preferred_source == "y" && "Ties go to the second member");

        auto resolutions = m_merger.resolveConflicts(m_merger.identifyConflicts({yes, no}));
        assert(resolutions.size() == 1);

        auto merged = m_merger.mergeWithConflictResolution({yes, no});
        assert(merged.content.rfind("The answer is yes", 0) == 0 && "Higher quality leads");
        assert(merged.sources.size() == 2 && "Conflicting outputs are both kept");
        assert(merged == m_merger.mergeOutputs({yes, no}) && "Resolution never changes the merge");

        std::cout << "✓ Conflict resolution test passed" << std::endl;
    }

    void testMergeBasics() {
        std::cout << "Testing basic merging..." << std::endl;

        auto empty = m_merger.mergeOutputs({});
        assert(empty.content.empty());
        assert(near(empty.quality, 0.0));
        assert(empty.sources.empty());

        Cortex::WorkerOutput only("solo", "Single answer", 0.42);
        auto single = m_merger.mergeOutputs({only});
        assert(single.content == "Single answer");
        assert(near(single.quality, 0.42));
        assert(single.sources.size() == 1 && single.sources[0] == "solo");

        Cortex::WorkerOutput low("low", "Use a queue", 0.3);
        Cortex::WorkerOutput high("high", "Use a lock free ring buffer", 0.8);
        auto pair = m_merger.mergeOutputs({low, high});
        assert(pair.content == "Use a lock free ring buffer\n\nAdditional insight: Use a queue");
        assert(pair.sources[0] == "high" && pair.sources[1] == "low");
        assert(near(pair.quality, (0.8 + 0.3) / 2.0));

        std::cout << "✓ Basic merge test passed" << std::endl;
    }

    void testTopThreeTruncation() {
        std::cout << "Testing top-three truncation..." << std::endl;

        std::vector<Cortex::WorkerOutput> outputs = {
            {"w5", "alpha bravo", 0.5},
            {"w2", "charlie delta", 0.8},
            {"w4", "echo foxtrot", 0.6},
            {"w1", "golf hotel", 0.9},
            {"w3", "india juliet", 0.7}
        };

        auto merged = m_merger.mergeOutputs(outputs);
        assert(near(merged.quality, 0.8) && "Mean of the top three");
        assert(merged.sources.size() == 3);
        assert(merged.sources[0] == "w1" && merged.sources[1] == "w2" && merged.sources[2] == "w3");
        assert(merged.content.find("echo foxtrot") == std::string::npos && "Fourth output never appears");
        assert(merged.content.find("alpha bravo") == std::string::npos && "Fifth output never appears");

        std::cout << "✓ Top-three truncation test passed" << std::endl;
    }

    void testRedundantOutputs() {
        std::cout << "Testing redundant output handling..." << std::endl;

        Cortex::WorkerOutput primary("p", "fix the null pointer bug", 0.9);
        Cortex::WorkerOutput echo("e", "fix the null pointer issue", 0.8);
        Cortex::WorkerOutput other("o", "add a regression test", 0.4);

        auto merged = m_merger.mergeOutputs({primary, echo, other});
        assert(merged.sources.size() == 2 && "Redundant output is skipped");
        assert(merged.sources[1] == "o");
        assert(near(merged.quality, (0.9 + 0.4) / 3.0) && "Skipped output still counts in the divisor");

        // Equal qualities keep input order
        Cortex::WorkerOutput first("first", "one two", 0.5);
        Cortex::WorkerOutput second("second", "three four", 0.5);
        auto tied = m_merger.mergeOutputs({first, second});
        assert(tied.sources[0] == "first");

        std::cout << "✓ Redundant output test passed" << std::endl;
    }

    void testCombineInsights() {
        std::cout << "Testing combineInsights..." << std::endl;

        assert(m_merger.combineInsights({}).empty());

        std::vector<Cortex::WorkerOutput> outputs = {
            {"w1", "alpha bravo", 0.1},
            {"w2", "charlie delta", 0.9},
            {"w3", "alpha bravo", 0.8},
            {"w4", "echo foxtrot", 0.7},
            {"w5", "golf hotel", 0.6}
        };

        std::string combined = m_merger.combineInsights(outputs);
        assert(combined == "alpha bravo"
                           "\n\nAdditional perspective: charlie delta"
                           "\n\nAdditional perspective: echo foxtrot"
                           "\n\nAdditional perspective: golf hotel");

        // Unlike mergeOutputs there is no quality ordering or truncation
        auto merged = m_merger.mergeOutputs(outputs);
        assert(merged.content.find("golf hotel") == std::string::npos);
        assert(combined.find("golf hotel") != std::string::npos);
        assert(merged.content.rfind("charlie delta", 0) == 0);
        assert(combined.rfind("alpha bravo", 0) == 0);

        std::cout << "✓ combineInsights test passed" << std::endl;
    }

    void testUnifiedResponse() {
        std::cout << "Testing unified response..." << std::endl;

        Cortex::WorkerOutput yes("a", "The answer is yes", 0.9);
        Cortex::WorkerOutput no("b", "The answer is no", 0.5);

        auto before = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        auto response = m_merger.createUnifiedResponse({yes, no}, "user-17");
        auto after = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();

        auto merged = m_merger.mergeWithConflictResolution({yes, no});
        assert(response.user_id == "user-17");
        assert(response.content == merged.content);
        assert(near(response.quality, merged.quality));
        assert(response.sources == merged.sources);
        assert(response.created_at_epoch_millis >= before && response.created_at_epoch_millis <= after);

        auto empty = m_merger.createUnifiedResponse({}, "nobody");
        assert(empty.content.empty() && empty.sources.empty());
        assert(empty.user_id == "nobody");

        std::cout << "✓ Unified response test passed" << std::endl;
    }

    void testConsistency() {
        std::cout << "Testing consistency check..." << std::endl;

        auto trivial = m_merger.checkConsistency({{"a", "anything", 0.5}});
        assert(trivial.is_consistent && near(trivial.average_similarity, 1.0));
        assert(m_merger.checkConsistency({}).is_consistent);

        auto agreeing = m_merger.checkConsistency({
            {"a", "use a mutex around the map", 0.8},
            {"b", "use a mutex around the map", 0.7}
        });
        assert(agreeing.is_consistent);
        assert(near(agreeing.average_similarity, 1.0));

        auto disagreeing = m_merger.checkConsistency({
            {"a", "use a mutex around the map", 0.8},
            {"b", "use a mutex around the map", 0.7},
            {"c", "rewrite it in assembly", 0.2}
        });
        assert(!disagreeing.is_consistent);
        assert(disagreeing.inconsistent_pairs.size() == 2);
        assert(disagreeing.inconsistent_pairs[0].first == "a");
        assert(disagreeing.inconsistent_pairs[0].second == "c");

        std::cout << "✓ Consistency check test passed" << std::endl;
    }

    void testStatistics() {
        std::cout << "Testing statistics..." << std::endl;

        auto stats = Cortex::OutputMerger::computeStatistics({
            {"a", "x", 0.2}, {"b", "y", 0.6}, {"c", "z", 1.0}
        });
        assert(stats.count == 3);
        assert(near(stats.mean_quality, 0.6));
        assert(near(stats.max_quality, 1.0));
        assert(near(stats.min_quality, 0.2));

        auto empty = Cortex::OutputMerger::computeStatistics({});
        assert(empty.count == 0 && near(empty.mean_quality, 0.0));

        m_merger.logMergerStatistics({{"a", "x", 0.2}});
        m_merger.logMergerStatistics({});

        std::cout << "✓ Statistics test passed" << std::endl;
    }

    void testQualityNormalization() {
        std::cout << "Testing quality normalization..." << std::endl;

        assert(near(Cortex::normalizeQuality(0.75), 0.75));
        assert(near(Cortex::normalizeQuality(85.0), 0.85) && "Percent scale converted");
        assert(near(Cortex::normalizeQuality(250.0), 1.0) && "Clamped high");
        assert(near(Cortex::normalizeQuality(-0.5), 0.0) && "Clamped low");
        assert(near(Cortex::normalizeQuality(std::numeric_limits<double>::quiet_NaN()), 0.0));
        assert(near(Cortex::normalizeQuality(1.0), 1.0) && "1 stays on the unit scale");

        std::cout << "✓ Quality normalization test passed" << std::endl;
    }

    void testJsonCodec() {
        std::cout << "Testing JSON codec..." << std::endl;

        auto outputs = Cortex::parseWorkerOutputs(R"([
            {"source": "a", "content": "first", "quality": 90},
            {"source": "b", "content": "second", "quality": 0.4},
            {"source": "c", "content": "third"}
        ])");
        assert(outputs.size() == 3);
        assert(near(outputs[0].quality, 0.9) && "Percent quality normalized on read");
        assert(near(outputs[1].quality, 0.4));
        assert(near(outputs[2].quality, 0.0) && "Missing quality reads as 0");

        auto wrapped = Cortex::parseWorkerOutputs(R"({"outputs": [{"source": "x", "content": "y", "quality": 1}]})");
        assert(wrapped.size() == 1 && wrapped[0].source == "x");

        bool threw = false;
        try {
            Cortex::parseWorkerOutputs(R"([{"content": "no source"}])");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "Missing source rejected");

        threw = false;
        try {
            Cortex::parseWorkerOutputs(R"({"items": []})");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw && "Object without outputs rejected");

        Cortex::UnifiedResponse response;
        response.user_id = "u";
        response.content = "c";
        response.quality = 0.5;
        response.sources = {"a", "b"};
        response.created_at_epoch_millis = 1700000000000;
        nlohmann::json j = response;
        assert(j["userId"] == "u");
        assert(j["sources"].size() == 2);
        assert(j["createdAtEpochMillis"].get<int64_t>() == 1700000000000);

        Cortex::ConsistencyReport report;
        report.is_consistent = false;
        report.inconsistent_pairs.push_back({"a", "c"});
        nlohmann::json rj = report;
        assert(rj["inconsistentPairs"][0][1] == "c");

        std::cout << "✓ JSON codec test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running OutputMerger unit tests..." << std::endl;
        std::cout << "=================================" << std::endl << std::endl;

        testSimilarity();
        std::cout << std::endl;

        testConflictDetection();
        std::cout << std::endl;

        testConflictResolution();
        std::cout << std::endl;

        testMergeBasics();
        std::cout << std::endl;

        testTopThreeTruncation();
        std::cout << std::endl;

        testRedundantOutputs();
        std::cout << std::endl;

        testCombineInsights();
        std::cout << std::endl;

        testUnifiedResponse();
        std::cout << std::endl;

        testConsistency();
        std::cout << std::endl;

        testStatistics();
        std::cout << std::endl;

        testQualityNormalization();
        std::cout << std::endl;

        testJsonCodec();
        std::cout << std::endl;

        std::cout << "All OutputMerger tests passed!" << std::endl;
    }
};

int main() {
    try {
        OutputMergerTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All OutputMerger component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
