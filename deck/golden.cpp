#include "golden.hpp"
#include "../lib/log.h"
#include "../lib/file.h"
#include <cstdio>
#include <cstdlib>
#include <json/json.h>

namespace deck {

const char* const GOLDEN_STAGES[] = { "xml", "svg", "png", "pdf" };
const int GOLDEN_STAGE_COUNT = 4;

static log_category_t* golden_log() {
    static log_category_t* category = log_get_category("deck.golden");
    return category;
}

static const char* outcome_name(StageOutcome outcome) {
    switch (outcome) {
    case OUTCOME_PASSED: return "passed";
    case OUTCOME_FAILED: return "FAILED";
    default:             return "skipped";
    }
}

static std::string dir_name(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? "" : path.substr(0, slash);
}

static std::string base_stem(const std::string& path) {
    size_t slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    size_t dot = name.find_last_of('.');
    return dot == std::string::npos ? name : name.substr(0, dot);
}

static bool read_bytes(const std::string& path, std::string* out) {
    size_t size = 0;
    unsigned char* data = read_binary_file(path.c_str(), &size);
    if (!data) return false;
    out->assign((const char*)data, size);
    free(data);
    return true;
}

// ============================================================================
// Results
// ============================================================================

bool CaseResult::failed() const {
    for (const StageResult& result : stages) {
        if (result.outcome == OUTCOME_FAILED) return true;
    }
    return false;
}

const StageResult* CaseResult::stage(const std::string& name) const {
    for (const StageResult& result : stages) {
        if (result.stage == name) return &result;
    }
    return nullptr;
}

void GoldenSummary::add(const CaseResult& result) {
    total++;
    if (result.skipped) skipped++;
    else if (result.failed()) failed++;
    else passed++;
    for (const StageResult& stage : result.stages) {
        StageCounts& counts = stages[stage.stage];
        switch (stage.outcome) {
        case OUTCOME_PASSED: counts.passed++;  break;
        case OUTCOME_FAILED: counts.failed++;  break;
        default:             counts.skipped++;  break;
        }
    }
    results.push_back(result);
}

std::string GoldenSummary::format(const std::string& title) const {
    char line[160];
    std::string report = title + "\n";
    snprintf(line, sizeof(line), "Overall: %d passed, %d failed, %d skipped\n", passed, failed, skipped);
    report += line;
    for (int i = 0; i < GOLDEN_STAGE_COUNT; i++) {
        auto it = stages.find(GOLDEN_STAGES[i]);
        StageCounts counts = it == stages.end() ? StageCounts() : it->second;
        snprintf(line, sizeof(line), "%s pipeline: %d passed, %d failed, %d skipped\n",
            GOLDEN_STAGES[i], counts.passed, counts.failed, counts.skipped);
        report += line;
    }
    return report;
}

// ============================================================================
// Catalog
// ============================================================================

bool load_golden_catalog(const std::string& path, GoldenCatalog* catalog, std::string* error) {
    char* text = read_text_file(path.c_str());
    if (!text) {
        *error = "cannot read golden catalog " + path;
        return false;
    }
    Json::Value root;
    Json::Reader reader;
    bool ok = reader.parse(text, root);
    free(text);
    if (!ok) {
        *error = "malformed golden catalog " + path + ": " + reader.getFormattedErrorMessages();
        return false;
    }
    if (!root.isObject() || !root["test_cases"].isArray()) {
        *error = "golden catalog " + path + " has no test_cases array";
        return false;
    }

    GoldenCatalog parsed;
    parsed.version = root.get("version", "").asString();
    parsed.description = root.get("description", "").asString();
    parsed.generated = root.get("generated", "").asString();
    parsed.source_base = root.get("source_base", "").asString();
    parsed.total_tests = root.get("total_tests", 0).asInt();

    const Json::Value& cases = root["test_cases"];
    for (Json::ArrayIndex i = 0; i < cases.size(); i++) {
        const Json::Value& entry = cases[i];
        if (!entry.isObject()) continue;
        GoldenCase test;
        test.name = entry.get("name", "").asString();
        test.category = entry.get("category", "").asString();
        const Json::Value& input = entry["input"];
        if (input.isObject()) test.dsh = input.get("dsh", "").asString();
        const Json::Value& outputs = entry["outputs"];
        if (outputs.isObject()) {
            for (const std::string& stage : outputs.getMemberNames()) {
                test.outputs[stage] = outputs[stage].asString();
            }
        }
        parsed.cases.push_back(test);
    }
    if (parsed.total_tests != 0 && parsed.total_tests != (int)parsed.cases.size()) {
        clog_warn(golden_log(), "catalog %s declares %d tests but lists %zu", path.c_str(),
            parsed.total_tests, parsed.cases.size());
    }
    *catalog = parsed;
    return true;
}

std::string describe_mismatch(const std::string& actual, const std::string& expected) {
    if (actual == expected) return "";
    size_t limit = actual.size() < expected.size() ? actual.size() : expected.size();
    size_t offset = 0;
    while (offset < limit && actual[offset] == expected[offset]) offset++;
    char report[160];
    snprintf(report, sizeof(report), "size %zu, expected %zu, first difference at byte %zu",
        actual.size(), expected.size(), offset);
    return report;
}

// ============================================================================
// Runner
// ============================================================================

GoldenRunner::GoldenRunner(Pipeline* pipeline, const std::string& base_dir)
    : pipeline_(pipeline), base_dir_(base_dir) {}

bool GoldenRunner::load(std::string* error) {
    return load_golden_catalog(base_dir_ + "/golden_tests.json", &catalog_, error);
}

StageResult GoldenRunner::compare_stage(const GoldenCase& test, const std::string& stage,
    const std::string& actual, const std::string& output_path) {
    StageResult result;
    result.stage = stage;
    auto it = test.outputs.find(stage);
    if (it == test.outputs.end() || it->second.empty()) {
        result.detail = "no reference listed";
        return result;
    }
    std::string expected_path = expected_dir() + "/" + it->second;
    std::string expected;
    if (!read_bytes(expected_path, &expected)) {
        result.detail = "reference not found: " + expected_path;
        return result;
    }
    std::string mismatch = describe_mismatch(actual, expected);
    if (mismatch.empty()) {
        result.outcome = OUTCOME_PASSED;
        return result;
    }
    result.outcome = OUTCOME_FAILED;
    result.detail = mismatch + "; compare " + output_path + " with " + expected_path +
        " and copy it over the reference if the change is intended";
    return result;
}

CaseResult GoldenRunner::run_case(const GoldenCase& test) {
    CaseResult result;
    result.name = test.name;
    result.category = test.category;
    clog_info(golden_log(), "running test: %s (%s)", test.name.c_str(), test.category.c_str());

    std::string dsh_path = input_dir() + "/" + test.dsh;
    char* source = test.dsh.empty() ? nullptr : read_text_file(dsh_path.c_str());
    if (!source) {
        result.skipped = true;
        result.skip_reason = "fixture not found: " + dsh_path;
        clog_warn(golden_log(), "  skipped: %s", result.skip_reason.c_str());
        return result;
    }
    std::string dsl(source);
    free(source);

    std::string out_dir = output_dir();
    std::string relative = dir_name(test.dsh);
    if (!relative.empty()) out_dir += "/" + relative;
    std::string stem = base_stem(test.dsh);
    if (!create_dir(out_dir.c_str())) {
        StageResult failure;
        failure.stage = "xml";
        failure.outcome = OUTCOME_FAILED;
        failure.detail = "cannot create output directory " + out_dir;
        result.stages.push_back(failure);
        return result;
    }

    // stage 1: DSL -> XML
    DeckError err;
    std::string xml;
    std::string xml_path = out_dir + "/" + stem + ".xml";
    bool have_xml = pipeline_->compile(dsl, &xml, &err) == DECK_OK;
    StageResult xml_stage;
    if (!have_xml) {
        xml_stage.stage = "xml";
        xml_stage.outcome = OUTCOME_FAILED;
        xml_stage.detail = err.describe();
    } else {
        if (!write_binary_file(xml_path.c_str(), xml.data(), xml.size())) {
            clog_warn(golden_log(), "cannot write %s", xml_path.c_str());
        }
        xml_stage = compare_stage(test, "xml", xml, xml_path);
    }
    result.stages.push_back(xml_stage);

    // stages 2-4: XML -> svg, png, pdf
    for (int i = 1; i < GOLDEN_STAGE_COUNT; i++) {
        std::string stage = GOLDEN_STAGES[i];
        StageResult render_stage;
        render_stage.stage = stage;
        if (xml_stage.outcome == OUTCOME_FAILED) {
            render_stage.detail = "xml stage failed";
            result.stages.push_back(render_stage);
            continue;
        }
        err.clear();
        std::string bytes;
        if (pipeline_->render_xml(xml, stage, options_, &bytes, &err) != DECK_OK) {
            if (test.outputs.count(stage)) {
                render_stage.outcome = OUTCOME_FAILED;
                render_stage.detail = err.describe();
            } else {
                render_stage.detail = "no reference listed";
            }
            result.stages.push_back(render_stage);
            continue;
        }
        std::string path = out_dir + "/" + stem + "." + stage;
        if (!write_binary_file(path.c_str(), bytes.data(), bytes.size())) {
            clog_warn(golden_log(), "cannot write %s", path.c_str());
        }
        result.stages.push_back(compare_stage(test, stage, bytes, path));
    }

    std::string line;
    for (const StageResult& stage : result.stages) {
        if (!line.empty()) line += ", ";
        line += stage.stage + ": " + outcome_name(stage.outcome);
    }
    if (result.failed()) {
        clog_error(golden_log(), "  test failed (%s)", line.c_str());
        for (const StageResult& stage : result.stages) {
            if (stage.outcome == OUTCOME_FAILED) {
                clog_error(golden_log(), "    - %s: %s", stage.stage.c_str(), stage.detail.c_str());
            }
        }
    } else {
        clog_info(golden_log(), "  test passed (%s)", line.c_str());
    }
    return result;
}

GoldenSummary GoldenRunner::run_all(const std::string& category) {
    GoldenSummary summary;
    for (const GoldenCase& test : catalog_.cases) {
        if (!category.empty() && test.category != category) continue;
        summary.add(run_case(test));
    }
    if (!category.empty() && summary.total == 0) {
        clog_warn(golden_log(), "no tests found for category: %s", category.c_str());
    }
    return summary;
}

bool GoldenRunner::cleanup() {
    std::string dir = output_dir();
    if (!dir_exists(dir.c_str())) {
        clog_info(golden_log(), "no test output directory to clean: %s", dir.c_str());
        return true;
    }
    if (!remove_dir(dir.c_str())) {
        clog_error(golden_log(), "failed to remove test output directory %s", dir.c_str());
        return false;
    }
    clog_info(golden_log(), "cleaned up test output directory: %s", dir.c_str());
    return true;
}

} // namespace deck
