// golden.hpp - Byte-exact regression harness over a catalog of DSL fixtures
//
// Layout under the base directory:
//   golden_tests.json   catalog
//   input/              DSL fixtures, catalog "input.dsh" is relative to it
//   expected/           reference artifacts, catalog "outputs" are relative to it
//   output/             generated artifacts, mirroring the input tree
//
// Stage "xml" compiles the fixture; "svg", "png" and "pdf" render the
// generated XML. A missing fixture skips the case and a missing reference
// skips the stage; neither counts as a failure.

#ifndef DECK_GOLDEN_HPP
#define DECK_GOLDEN_HPP

#include "pipeline.hpp"
#include <map>
#include <string>
#include <vector>

namespace deck {

extern const char* const GOLDEN_STAGES[];
extern const int GOLDEN_STAGE_COUNT;

struct GoldenCase {
    std::string name;
    std::string category;
    std::string dsh;                                // fixture path relative to input/
    std::map<std::string, std::string> outputs;     // stage -> path relative to expected/
};

struct GoldenCatalog {
    std::string version;
    std::string description;
    std::string generated;
    std::string source_base;
    int total_tests = 0;
    std::vector<GoldenCase> cases;
};

enum StageOutcome {
    OUTCOME_SKIPPED,
    OUTCOME_PASSED,
    OUTCOME_FAILED,
};

struct StageResult {
    std::string stage;
    StageOutcome outcome = OUTCOME_SKIPPED;
    std::string detail;         // mismatch report, error or skip reason
};

struct CaseResult {
    std::string name;
    std::string category;
    bool skipped = false;       // fixture missing
    std::string skip_reason;
    std::vector<StageResult> stages;

    bool failed() const;
    const StageResult* stage(const std::string& name) const;
};

struct StageCounts {
    int passed = 0;
    int failed = 0;
    int skipped = 0;
};

struct GoldenSummary {
    int total = 0;
    int passed = 0;
    int failed = 0;
    int skipped = 0;
    std::map<std::string, StageCounts> stages;
    std::vector<CaseResult> results;

    void add(const CaseResult& result);
    // multi-line report, one line per stage
    std::string format(const std::string& title) const;
};

// parse a catalog; false with error set when the file is unreadable or malformed
bool load_golden_catalog(const std::string& path, GoldenCatalog* catalog, std::string* error);

// empty when equal, otherwise sizes and the first differing byte offset
std::string describe_mismatch(const std::string& actual, const std::string& expected);

class GoldenRunner {
public:
    GoldenRunner(Pipeline* pipeline, const std::string& base_dir);

    // read <base>/golden_tests.json
    bool load(std::string* error);
    const GoldenCatalog& catalog() const { return catalog_; }

    CaseResult run_case(const GoldenCase& test);
    // every case, or only those in category when it is non-empty
    GoldenSummary run_all(const std::string& category = "");

    // remove the output directory
    bool cleanup();

    std::string input_dir() const { return base_dir_ + "/input"; }
    std::string expected_dir() const { return base_dir_ + "/expected"; }
    std::string output_dir() const { return base_dir_ + "/output"; }

    RenderOptions& options() { return options_; }

private:
    StageResult compare_stage(const GoldenCase& test, const std::string& stage,
        const std::string& actual, const std::string& output_path);

    Pipeline* pipeline_;
    std::string base_dir_;
    GoldenCatalog catalog_;
    RenderOptions options_;
};

} // namespace deck

#endif // DECK_GOLDEN_HPP
