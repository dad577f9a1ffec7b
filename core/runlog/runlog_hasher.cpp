#include "runlog/runlog_hasher.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace putman {

namespace canonical {

namespace {

// "1e-07" → "1e-7", "1e+21" stays.
std::string trimExponent(const std::string& text) {
    auto pos = text.find('e');
    if (pos == std::string::npos) return text;
    std::string mantissa = text.substr(0, pos);
    char sign = text[pos + 1];
    std::string digits = text.substr(pos + 2);
    digits.erase(0, std::min(digits.find_first_not_of('0'), digits.size() - 1));
    return mantissa + "e" + sign + digits;
}

} // namespace

std::string number(double value) {
    if (!std::isfinite(value)) return "null";
    if (value == 0.0) return "0";

    char buf[64];
    double magnitude = std::fabs(value);
    if (magnitude >= 1e-6 && magnitude < 1e21) {
        if (value == std::floor(value)) {
            std::snprintf(buf, sizeof(buf), "%.0f", value);
            return buf;
        }
        auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
        return std::string(buf, res.ptr);
    }
    auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
    return trimExponent(std::string(buf, res.ptr));
}

std::string string(const std::string& value) {
    std::ostringstream oss;
    oss << '"';
    for (unsigned char c : value) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
    return oss.str();
}

std::string array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += ",";
        out += items[i];
    }
    out += "]";
    return out;
}

std::string stringArray(const std::vector<std::string>& values) {
    std::vector<std::string> items;
    items.reserve(values.size());
    for (const auto& v : values) items.push_back(string(v));
    return array(items);
}

std::string object(std::vector<std::pair<std::string, std::string>> fields) {
    std::sort(fields.begin(), fields.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    std::string out = "{";
    for (size_t i = 0; i < fields.size(); i++) {
        if (i > 0) out += ",";
        out += string(fields[i].first);
        out += ":";
        out += fields[i].second;
    }
    out += "}";
    return out;
}

std::string numberMap(const std::map<std::string, double>& values) {
    std::vector<std::pair<std::string, std::string>> fields;
    fields.reserve(values.size());
    for (const auto& [key, value] : values) {
        fields.emplace_back(key, number(value));
    }
    return object(std::move(fields));
}

} // namespace canonical

namespace {

std::string encodeScoredIds(const std::vector<ScoredId>& entries) {
    std::vector<std::string> items;
    for (const auto& e : entries) {
        items.push_back(canonical::object({
            {"id", canonical::string(e.id)},
            {"score", canonical::number(e.score)},
        }));
    }
    return canonical::array(items);
}

std::string encodeCandidates(const std::vector<BeamCandidate>& candidates) {
    std::vector<std::string> items;
    for (const auto& c : candidates) {
        items.push_back(canonical::object({
            {"nodePath", canonical::stringArray(c.node_path)},
            {"edgePath", canonical::stringArray(c.edge_path)},
            {"score", canonical::number(c.score)},
        }));
    }
    return canonical::array(items);
}

std::string encodeInterpretation(const InterpretationSummary& summary) {
    return canonical::object({
        {"topNodes", encodeScoredIds(summary.top_nodes)},
        {"topEdges", encodeScoredIds(summary.top_edges)},
        {"centroid", canonical::numberMap(summary.centroid)},
    });
}

} // namespace

std::string RunlogHasher::canonicalize(const PipelineParams& params) {
    std::vector<std::pair<std::string, std::string>> fields;
    for (const auto& name : PipelineParams::fieldNames()) {
        fields.emplace_back(name, canonical::number(params.get(name)));
    }
    return canonical::object(std::move(fields));
}

std::string RunlogHasher::canonicalize(const StepRunLog& step) {
    return canonical::object({
        {"step", canonical::number(step.step)},
        {"seed", canonical::number(step.seed)},
        {"params", canonicalize(step.params)},
        {"activeSet", canonical::stringArray(step.active_set)},
        {"prunedNodes", canonical::stringArray(step.pruned_nodes)},
        {"prunedEdges", canonical::stringArray(step.pruned_edges)},
        {"beamCandidates", encodeCandidates(step.beam_candidates)},
        {"interpretation", encodeInterpretation(step.interpretation)},
        {"activationVector", canonical::numberMap(step.activation_vector)},
        {"edgeWeights", canonical::numberMap(step.edge_weights)},
        {"delta", canonical::number(step.delta)},
    });
}

std::string RunlogHasher::canonicalize(const RunLog& runlog) {
    std::vector<std::string> steps;
    steps.reserve(runlog.steps.size());
    for (const auto& s : runlog.steps) steps.push_back(canonicalize(s));

    return canonical::object({
        {"model", canonical::string(runlog.model)},
        {"createdAt", canonical::string(runlog.created_at)},
        {"params", canonicalize(runlog.params)},
        {"steps", canonical::array(steps)},
    });
}

uint32_t RunlogHasher::fnv1a(const std::string& text) {
    uint32_t hash = kOffsetBasis;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= kPrime;
    }
    return hash;
}

std::string RunlogHasher::toHex(uint32_t value) {
    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << value;
    return oss.str();
}

std::string RunlogHasher::hash(const RunLog& runlog) {
    return toHex(fnv1a(canonicalize(runlog)));
}

} // namespace putman
