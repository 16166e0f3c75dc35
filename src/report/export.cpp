#include "frame_diff/report/export.hpp"

#include "frame_diff/core/utils.hpp"
#include "frame_diff/io/fits_io.hpp"

#include <algorithm>

namespace frame_diff::report {

using json = nlohmann::json;

std::string frame_label(const std::string& frame_id) {
    std::string name = fs::path(frame_id).filename().string();
    const std::string lower = core::to_lower(name);
    for (const char* ext : {".fits", ".fit", ".fts"}) {
        const std::string e(ext);
        if (lower.size() > e.size() && core::ends_with(lower, e)) {
            return name.substr(0, name.size() - e.size());
        }
    }
    return name;
}

Matrix2Dd extract_zoom_window(const DifferentialMap& map, int x, int y, int half_size) {
    const int h = static_cast<int>(map.rows());
    const int w = static_cast<int>(map.cols());
    const int r0 = std::max(0, y - half_size);
    const int r1 = std::min(h, y + half_size);
    const int c0 = std::max(0, x - half_size);
    const int c1 = std::min(w, x + half_size);
    if (r1 <= r0 || c1 <= c0) {
        return Matrix2Dd(0, 0);
    }
    return map.block(r0, c0, r1 - r0, c1 - c0);
}

json candidate_to_json(const Candidate& c) {
    return {
        {"id", c.id},
        {"x", c.x},
        {"y", c.y},
        {"magnitude", c.magnitude},
        {"promising", c.promising},
        {"signature", c.signature}
    };
}

json comparison_to_json(const ComparisonResult& result) {
    json j;
    j["pairing_index"] = result.pairing_index;
    j["reference"] = result.reference_id;
    j["comparison"] = result.comparison_id;
    j["reference_label"] = frame_label(result.reference_id);
    j["comparison_label"] = frame_label(result.comparison_id);
    j["state"] = pairing_state_to_string(result.state);

    if (result.error) {
        j["status"] = "error";
        j["error"] = {
            {"kind", pairing_error_kind_to_string(result.error->kind)},
            {"message", result.error->message}
        };
        return j;
    }

    j["status"] = "ok";
    if (result.differential) {
        j["shape"] = {result.differential->rows(), result.differential->cols()};
    }
    j["map_stddev"] = result.map_stddev;
    j["threshold"] = result.threshold;
    j["promising_cutoff"] = result.promising_cutoff;
    j["n_candidates"] = result.all_candidates.size();
    j["n_promising"] = result.promising_candidates.size();

    json all = json::array();
    for (const auto& c : result.all_candidates) {
        all.push_back(candidate_to_json(c));
    }
    json promising = json::array();
    for (const auto& c : result.promising_candidates) {
        promising.push_back(candidate_to_json(c));
    }
    j["all_candidates"] = std::move(all);
    j["promising_candidates"] = std::move(promising);
    return j;
}

json results_to_json(const std::vector<ComparisonResult>& results, const RunContext& context) {
    json comparisons = json::array();
    int n_failed = 0;
    for (const auto& r : results) {
        if (!r.ok()) ++n_failed;
        comparisons.push_back(comparison_to_json(r));
    }
    return {
        {"run_id", context.run_id},
        {"signature", context.signature},
        {"n_comparisons", results.size()},
        {"n_failed", n_failed},
        {"comparisons", std::move(comparisons)}
    };
}

std::string differential_filename(const ComparisonResult& result) {
    return "diff_comp" + std::to_string(result.pairing_index) + "_" +
           frame_label(result.reference_id) + "_vs_" +
           frame_label(result.comparison_id) + ".fits";
}

std::string zoom_filename(const ComparisonResult& result, const Candidate& candidate) {
    return "zoom_comp" + std::to_string(result.pairing_index) + "_" +
           frame_label(result.reference_id) + "_vs_" +
           frame_label(result.comparison_id) + "_" + candidate.id + ".fits";
}

std::vector<fs::path> write_differentials(const std::vector<ComparisonResult>& results,
                                          const fs::path& out_dir,
                                          const RunContext& context) {
    std::vector<fs::path> written;
    fs::create_directories(out_dir);
    for (const auto& r : results) {
        if (!r.ok() || !r.differential) continue;

        io::FitsHeader header;
        header.set("RUNID", context.run_id);
        header.set("SIGNATUR", context.signature);
        header.set("PAIRIDX", r.pairing_index);
        header.set("THRESH", r.threshold);
        header.set("PCUTOFF", r.promising_cutoff);
        header.set("NCAND", static_cast<int>(r.all_candidates.size()));

        const fs::path path = out_dir / differential_filename(r);
        io::write_fits_double(path, *r.differential, header);
        written.push_back(path);
    }
    return written;
}

std::vector<fs::path> write_zoom_windows(const std::vector<ComparisonResult>& results,
                                         const fs::path& out_dir, int half_size) {
    std::vector<fs::path> written;
    fs::create_directories(out_dir);
    for (const auto& r : results) {
        if (!r.ok() || !r.differential) continue;
        for (const auto& c : r.promising_candidates) {
            const Matrix2Dd window = extract_zoom_window(*r.differential, c.x, c.y, half_size);
            if (window.size() == 0) continue;

            io::FitsHeader header;
            header.set("CANDID", c.id);
            header.set("CANDX", c.x);
            header.set("CANDY", c.y);
            header.set("MAGNITUD", c.magnitude);

            const fs::path path = out_dir / zoom_filename(r, c);
            io::write_fits_double(path, window, header);
            written.push_back(path);
        }
    }
    return written;
}

} // namespace frame_diff::report
