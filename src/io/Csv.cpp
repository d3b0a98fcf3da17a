// ========================= src/io/Csv.cpp =========================
#include "Csv.hpp"
#include "../core/Log.hpp"
#include <fstream>
#include <sstream>
#include <filesystem>
#include <stdexcept>

namespace fl {

    static std::vector<std::string> split(const std::string& s, char sep) {
        std::vector<std::string> out; std::string cur; std::istringstream iss(s);
        while (std::getline(iss, cur, sep)) out.push_back(cur);
        return out;
    }

    template <class T>
    static std::string join(const std::vector<T>& items, char sep) {
        std::ostringstream oss;
        for (size_t i = 0; i < items.size(); ++i) {
            oss << items[i];
            if (i + 1 < items.size()) oss << sep;
        }
        return oss.str();
    }

    std::string CsvIO::encodeGrid(const Grid& g) {
        std::ostringstream oss;
        for (int r = 0; r < g.n; ++r) {
            for (int c = 0; c < g.n; ++c) oss << colorIndex(g.at(r, c));
            if (r + 1 < g.n) oss << '#';
        }
        return oss.str();
    }

    bool CsvIO::decodeGrid(const std::string& token, Grid& out) {
        auto rows = split(token, '#');
        if (rows.empty()) return false;
        Grid g(static_cast<int>(rows.size()), Color::Red);
        for (int r = 0; r < g.n; ++r) {
            if ((int)rows[r].size() != g.n) return false;
            for (int c = 0; c < g.n; ++c) {
                auto col = colorFromIndex(rows[r][c] - '0');
                if (!col) return false;
                g.at(r, c) = *col;
            }
        }
        out = std::move(g);
        return true;
    }

    CsvRow CsvIO::encode(int index, const Puzzle& pz) {
        CsvRow row;
        row.index = index;
        row.date = pz.date;
        row.target = colorIndex(pz.target);
        row.colorMap = join(pz.colorMap, '_');

        std::vector<std::string> grids;
        if (pz.trace.snapshots.empty()) grids.push_back(encodeGrid(pz.start));
        for (const auto& g : pz.trace.snapshots) grids.push_back(encodeGrid(g));
        row.states = join(grids, '/');

        row.actions = join(pz.trace.actions, '_');
        row.algoScore = pz.algoScore;
        return row;
    }

    static bool reject(std::string* outReason, const std::string& why) {
        if (outReason) *outReason = why;
        return false;
    }

    bool CsvIO::decode(const CsvRow& row, Puzzle& outPuzzle, std::string* outReason) {
        Puzzle pz;
        pz.date = row.date;
        pz.algoScore = row.algoScore;

        auto target = colorFromIndex(row.target);
        if (!target) return reject(outReason, "bad target color " + std::to_string(row.target));
        pz.target = *target;

        try {
            for (const auto& tok : split(row.colorMap, '_')) {
                if (!tok.empty()) pz.colorMap.push_back(std::stoi(tok));
            }
            for (const auto& tok : split(row.actions, '_')) {
                if (!tok.empty()) pz.trace.actions.push_back(std::stoi(tok));
            }
        }
        catch (const std::invalid_argument&) { return reject(outReason, "non-numeric action or color map entry"); }
        catch (const std::out_of_range&) { return reject(outReason, "action or color map entry out of range"); }

        for (const auto& tok : split(row.states, '/')) {
            Grid g;
            if (!decodeGrid(tok, g)) return reject(outReason, "bad grid '" + tok + "'");
            pz.trace.snapshots.push_back(std::move(g));
        }
        if (pz.trace.snapshots.empty()) return reject(outReason, "no states");
        pz.start = pz.trace.snapshots.front();

        outPuzzle = std::move(pz);
        return true;
    }

    bool CsvIO::save(const std::string& path, const std::vector<CsvRow>& rows, bool appendIfExists) {
        namespace fs = std::filesystem;
        bool exists = fs::exists(path);
        std::ofstream f(path, std::ios::out | (appendIfExists ? std::ios::app : std::ios::trunc));
        if (!f) { logError("Csv", "cannot open %s for writing", path.c_str()); return false; }
        if (!exists || !appendIfExists) {
            f << "index,date,target,colorMap,states,actions,algoScore\n";
        }
        for (const auto& r : rows) {
            f << r.index << ',' << r.date << ',' << r.target << ',' << r.colorMap << ','
                << r.states << ',' << r.actions << ',' << r.algoScore << "\n";
        }
        return bool(f);
    }

    std::vector<CsvRow> CsvIO::load(const std::string& path) {
        std::vector<CsvRow> out; std::ifstream f(path);
        if (!f) { logWarn("Csv", "cannot open %s", path.c_str()); return out; }
        std::string line; bool first = true; int lineNo = 0;
        while (std::getline(f, line)) {
            ++lineNo;
            if (first) { first = false; continue; }
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;
            // keep empty trailing fields (colorMap/actions may be blank)
            std::vector<std::string> cells; std::string cur;
            for (char ch : line) { if (ch == ',') { cells.push_back(cur); cur.clear(); } else cur.push_back(ch); }
            cells.push_back(cur);
            if (cells.size() < 7) { logWarn("Csv", "%s:%d: expected 7 fields, got %d", path.c_str(), lineNo, (int)cells.size()); continue; }
            try {
                CsvRow r; int i = 0;
                r.index = std::stoi(cells[i++]);
                r.date = cells[i++];
                r.target = std::stoi(cells[i++]);
                r.colorMap = cells[i++];
                r.states = cells[i++];
                r.actions = cells[i++];
                r.algoScore = cells[i].empty() ? -1 : std::stoi(cells[i]);
                out.push_back(std::move(r));
            }
            catch (const std::exception& e) {
                logWarn("Csv", "%s:%d: skipped (%s)", path.c_str(), lineNo, e.what());
            }
        }
        return out;
    }

} // namespace fl
