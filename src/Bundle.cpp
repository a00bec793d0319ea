#include "../include/Bundle.hpp"
#include "../include/Status.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>
#include <locale>
#include <sstream>

using namespace assay;
namespace fs = std::filesystem;

namespace {
    struct OutLine {
        std::string text;
        int source = -1; // -1 = generated, not mapped
        int line = 0;
    };

    std::string trim(const std::string &x) {
        const auto b = x.find_first_not_of(" \t\r");
        if (b == std::string::npos) return {};
        const auto e = x.find_last_not_of(" \t\r");
        return x.substr(b, e - b + 1);
    }

    std::vector<std::string> split_lines(const std::string &text) {
        std::vector<std::string> lines;
        std::istringstream iss(text);
        std::string line;
        while (std::getline(iss, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(std::move(line));
        }
        return lines;
    }

    std::string read_source(const fs::path &p) {
        std::ifstream ifs(p, std::ios::binary);
        if (!ifs) throw std::runtime_error(std::string(_("cannot read source file: ")) + p.string());
        return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
    }

    void write_text(const fs::path &p, const std::string &text) {
        if (p.has_parent_path()) fs::create_directories(p.parent_path());
        std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
        if (!ofs) throw std::runtime_error(std::string(_("cannot write file: ")) + p.string());
        ofs << text;
        if (!ofs) throw std::runtime_error(std::string(_("cannot write file: ")) + p.string());
    }

    std::string ordinal_suffix(const int day) {
        if (day % 100 >= 11 && day % 100 <= 13) return "th";
        switch (day % 10) {
            case 1: return "st";
            case 2: return "nd";
            case 3: return "rd";
            default: return "th";
        }
    }

    std::string encode_mappings(const std::vector<OutLine> &lines) {
        std::string out;
        int prev_source = 0;
        int prev_line = 0;
        for (std::size_t i = 0; i < lines.size(); ++i) {
            if (i) out.push_back(';');
            const auto &l = lines[i];
            if (l.source < 0) continue;
            out += encode_vlq(0);
            out += encode_vlq(l.source - prev_source);
            out += encode_vlq(l.line - prev_line);
            out += encode_vlq(0);
            prev_source = l.source;
            prev_line = l.line;
        }
        return out;
    }
} // namespace

std::string Preamble::render() const {
    return "/*!\n " + package + " - v" + version + "\n " + timestamp + "\n branch: " + branch + " revision: " +
           revision + "*/\n";
}

namespace assay {
    std::string format_timestamp(const std::time_t when) {
        std::tm tm{};
        localtime_r(&when, &tm);
        // English names whatever LC_TIME says
        static const char *const weekdays[] = {
            "Sunday", "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday"
        };
        static const char *const months[] = {
            "January", "February", "March", "April", "May", "June", "July", "August", "September", "October",
            "November", "December"
        };
        int hour = tm.tm_hour % 12;
        if (hour == 0) hour = 12;
        char clock[32];
        std::snprintf(clock, sizeof(clock), "%d:%02d:%02d %s", hour, tm.tm_min, tm.tm_sec,
                      tm.tm_hour < 12 ? "AM" : "PM");
        std::ostringstream os;
        os.imbue(std::locale::classic());
        os << weekdays[tm.tm_wday] << ", " << months[tm.tm_mon] << " " << tm.tm_mday << ordinal_suffix(tm.tm_mday) << ", "
           << (tm.tm_year + 1900) << ", " << clock;
        return os.str();
    }

    std::string strip_script(const std::string &text, std::vector<int> *kept_lines) {
        enum class Mode { Code, Block, Template };
        std::string out;
        Mode mode = Mode::Code;
        const auto lines = split_lines(text);
        for (std::size_t n = 0; n < lines.size(); ++n) {
            const std::string &line = lines[n];
            const bool opens_in_template = mode == Mode::Template;
            std::string s;
            std::size_t i = 0;
            while (i < line.size()) {
                if (mode == Mode::Block) {
                    const auto end = line.find("*/", i);
                    if (end == std::string::npos) {
                        i = line.size();
                        break;
                    }
                    mode = Mode::Code;
                    i = end + 2;
                    continue;
                }
                if (mode == Mode::Template) {
                    const char c = line[i++];
                    s.push_back(c);
                    if (c == '\\' && i < line.size()) s.push_back(line[i++]);
                    else if (c == '`') mode = Mode::Code;
                    continue;
                }
                const char c = line[i];
                const char next = i + 1 < line.size() ? line[i + 1] : '\0';
                const bool leading = trim(s).empty() && !opens_in_template;
                if (c == '/' && next == '/') {
                    if (!leading) s.append(line, i, std::string::npos);
                    break;
                }
                if (c == '/' && next == '*') {
                    const auto end = line.find("*/", i + 2);
                    if (end == std::string::npos) {
                        // unterminated: the rest of the comment follows on later lines
                        mode = Mode::Block;
                        i = line.size();
                        break;
                    }
                    if (!leading) s.append(line, i, end + 2 - i);
                    i = end + 2;
                    continue;
                }
                if (c == '"' || c == '\'') {
                    // single-line string, copied as written
                    s.push_back(c);
                    ++i;
                    while (i < line.size()) {
                        const char d = line[i++];
                        s.push_back(d);
                        if (d == '\\' && i < line.size()) s.push_back(line[i++]);
                        else if (d == c) break;
                    }
                    continue;
                }
                if (c == '`') mode = Mode::Template;
                s.push_back(c);
                ++i;
            }

            // whitespace belongs to the literal on lines that start or end inside one
            const bool closes_in_template = mode == Mode::Template;
            if (!opens_in_template) {
                const auto b = s.find_first_not_of(" \t");
                s.erase(0, b == std::string::npos ? s.size() : b);
            }
            if (!closes_in_template) {
                const auto e = s.find_last_not_of(" \t");
                s.erase(e == std::string::npos ? 0 : e + 1);
            }
            if (s.empty() && !(opens_in_template && closes_in_template)) continue;
            out += s;
            out.push_back('\n');
            if (kept_lines) kept_lines->push_back(static_cast<int>(n));
        }
        return out;
    }

    std::string encode_vlq(const int value) {
        static const char *const base64 = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        unsigned int v = value < 0 ? (static_cast<unsigned int>(-value) << 1) | 1u : static_cast<unsigned int>(value) << 1;
        std::string out;
        do {
            unsigned int digit = v & 31u;
            v >>= 5;
            if (v > 0) digit |= 32u;
            out.push_back(base64[digit]);
        } while (v > 0);
        return out;
    }

    DistributionOutput write_bundle(const BundleRequest &request) {
        std::vector<OutLine> lines;
        for (auto &l: split_lines(request.preamble)) lines.push_back({std::move(l), -1, 0});

        for (std::size_t src = 0; src < request.files.size(); ++src) {
            const std::string text = read_source(request.root / request.files[src]);
            if (request.expanded) {
                int n = 0;
                for (auto &l: split_lines(text)) lines.push_back({std::move(l), static_cast<int>(src), n++});
            } else {
                std::vector<int> kept;
                const auto stripped = split_lines(strip_script(text, &kept));
                for (std::size_t i = 0; i < stripped.size(); ++i) {
                    lines.push_back({stripped[i], static_cast<int>(src), kept[i]});
                }
            }
        }
        lines.push_back({"//# sourceMappingURL=" + request.map_url, -1, 0});

        std::string code;
        for (const auto &l: lines) {
            code += l.text;
            code.push_back('\n');
        }

        nlohmann::json map;
        map["version"] = 3;
        map["file"] = request.output.filename().string();
        map["sources"] = request.files;
        map["names"] = nlohmann::json::array();
        map["mappings"] = encode_mappings(lines);

        DistributionOutput out;
        out.bundle_path = request.output;
        out.map_path = request.output;
        out.map_path += ".map";
        write_text(out.bundle_path, code);
        write_text(out.map_path, map.dump());
        return out;
    }
} // namespace assay
