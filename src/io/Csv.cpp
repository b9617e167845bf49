// ========================= src/io/Csv.cpp =========================
#include "Csv.hpp"
#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace wss {

    static const char* kHeader = "index,map,NumberOfColor,NumberOfSlot,NumberOfStack,EmptyStack,Outcome,MinMoves,Solution";
    static constexpr size_t kColumns = 9;

    // keeps empty fields, including trailing ones ("a##" -> {"a","",""})
    static std::vector<std::string> split(const std::string& s, char sep) {
        std::vector<std::string> out; std::string cur;
        for (char ch : s) {
            if (ch == sep) { out.push_back(cur); cur.clear(); }
            else cur.push_back(ch);
        }
        out.push_back(cur);
        return out;
    }

    static bool parseInt(const std::string& s, int& out) {
        if (s.empty()) return false;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
        return ec == std::errc() && ptr == s.data() + s.size();
    }

    // separators and line breaks inside a token become %XX; '%' itself too
    static bool needsEscape(char c) { return c == '%' || c == '_' || c == '#' || c == ',' || c == '\n' || c == '\r'; }

    static std::string escapeToken(const std::string& tok) {
        static const char* hex = "0123456789ABCDEF";
        std::string out; out.reserve(tok.size());
        for (char c : tok) {
            if (!needsEscape(c)) { out.push_back(c); continue; }
            unsigned char u = (unsigned char)c;
            out.push_back('%'); out.push_back(hex[u >> 4]); out.push_back(hex[u & 0xF]);
        }
        return out;
    }

    static int hexValue(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        return -1;
    }

    static bool unescapeToken(const std::string& text, std::string& out) {
        std::string tok; tok.reserve(text.size());
        for (size_t i = 0; i < text.size(); ++i) {
            if (text[i] != '%') { tok.push_back(text[i]); continue; }
            if (i + 2 >= text.size()) return false;
            int hi = hexValue(text[i + 1]), lo = hexValue(text[i + 2]);
            if (hi < 0 || lo < 0) return false;
            tok.push_back((char)(hi * 16 + lo));
            i += 2;
        }
        out = std::move(tok);
        return true;
    }

    static std::string encodeMap(const PuzzleInput& in) {
        std::ostringstream oss;
        for (size_t i = 0; i < in.tubes.size(); ++i) {
            const auto& t = in.tubes[i];
            for (size_t k = 0; k < t.size(); ++k) {
                if (k > 0) oss << '_';
                oss << escapeToken(t[k]);
            }
            if (i + 1 < in.tubes.size()) oss << '#';
        }
        return oss.str();
    }

    static int countColors(const PuzzleInput& in) {
        std::vector<std::string> seen;
        for (const auto& t : in.tubes)
            for (const auto& tok : t)
                if (std::find(seen.begin(), seen.end(), tok) == seen.end()) seen.push_back(tok);
        return (int)seen.size();
    }

    CsvRow CsvIO::encode(int index, const PuzzleInput& in, const SolveResult* result) {
        CsvRow row;
        row.index = index;
        row.map = encodeMap(in);
        row.NumberOfColor = countColors(in);
        row.NumberOfSlot = in.capacity;
        row.NumberOfStack = in.totalTubes;
        row.EmptyStack = in.emptyTubes;
        if (result) {
            row.Outcome = toString(result->outcome);
            if (result->solved()) {
                row.MinMoves = (int)result->moves.size();
                row.Solution = encodeMoves(result->moves);
            }
        }
        return row;
    }

    CsvRow CsvIO::encode(int index, const State& s, const Palette& palette, const SolveResult* result) {
        return encode(index, toInput(s, palette), result);
    }

    bool CsvIO::decode(const CsvRow& row, PuzzleInput& out, std::string* error) {
        PuzzleInput in;
        in.totalTubes = row.NumberOfStack;
        in.capacity = row.NumberOfSlot;
        in.emptyTubes = row.EmptyStack;
        for (const auto& field : split(row.map, '#')) {
            std::vector<std::string> tube;
            if (!field.empty()) {
                for (const auto& raw : split(field, '_')) {
                    std::string tok;
                    if (raw.empty() || !unescapeToken(raw, tok) || tok.empty()) {
                        if (error) *error = "bad color token '" + raw + "' in map field '" + field + "'";
                        return false;
                    }
                    tube.push_back(std::move(tok));
                }
            }
            in.tubes.push_back(std::move(tube));
        }
        out = std::move(in);
        return true;
    }

    std::string CsvIO::encodeMoves(const std::vector<Move>& moves) {
        std::ostringstream oss;
        for (size_t i = 0; i < moves.size(); ++i) {
            if (i > 0) oss << ' ';
            oss << moves[i].from << '>' << moves[i].to;
        }
        return oss.str();
    }

    bool CsvIO::decodeMoves(const std::string& text, std::vector<Move>& out, std::string* error) {
        std::vector<Move> moves;
        std::istringstream iss(text);
        std::string tok;
        while (iss >> tok) {
            auto parts = split(tok, '>');
            Move m;
            if (parts.size() != 2 || !parseInt(parts[0], m.from) || !parseInt(parts[1], m.to)) {
                if (error) *error = "bad move '" + tok + "'";
                return false;
            }
            moves.push_back(m);
        }
        out = std::move(moves);
        return true;
    }

    bool CsvIO::save(const std::string& path, const std::vector<CsvRow>& rows, bool appendIfExists, std::string* error) {
        namespace fs = std::filesystem;
        std::error_code ec;
        bool exists = fs::exists(path, ec);
        std::ofstream f(path, std::ios::out | (appendIfExists ? std::ios::app : std::ios::trunc));
        if (!f) {
            if (error) *error = "cannot open " + path + " for writing";
            return false;
        }
        if (!exists || !appendIfExists) f << kHeader << "\n";
        for (const auto& r : rows) {
            f << r.index << ',' << r.map << ',' << r.NumberOfColor << ',' << r.NumberOfSlot << ','
                << r.NumberOfStack << ',' << r.EmptyStack << ',' << r.Outcome << ',' << r.MinMoves << ','
                << r.Solution << "\n";
        }
        if (!f) {
            if (error) *error = "write to " + path + " failed";
            return false;
        }
        return true;
    }

    bool CsvIO::load(const std::string& path, std::vector<CsvRow>& out, std::vector<std::string>* skipped, std::string* error) {
        std::ifstream f(path);
        if (!f) {
            if (error) *error = "cannot open " + path;
            return false;
        }
        std::vector<CsvRow> rows;
        std::string line; bool first = true; int lineNo = 0;
        while (std::getline(f, line)) {
            ++lineNo;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (first) { first = false; continue; }
            if (line.empty()) continue;
            auto cells = split(line, ',');
            auto skip = [&](const std::string& why) {
                if (skipped) skipped->push_back("line " + std::to_string(lineNo) + ": " + why);
            };
            if (cells.size() < kColumns) { skip("expected " + std::to_string(kColumns) + " columns"); continue; }
            CsvRow r;
            r.map = cells[1];
            r.Outcome = cells[6];
            r.Solution = cells[8];
            if (!parseInt(cells[0], r.index) || !parseInt(cells[2], r.NumberOfColor) ||
                !parseInt(cells[3], r.NumberOfSlot) || !parseInt(cells[4], r.NumberOfStack) ||
                !parseInt(cells[5], r.EmptyStack) || !parseInt(cells[7], r.MinMoves)) {
                skip("non-numeric field");
                continue;
            }
            rows.push_back(std::move(r));
        }
        out = std::move(rows);
        return true;
    }

} // namespace wss
