#include "knora/dataset.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <utility>
#include <zlib.h>

namespace knora {

namespace {

constexpr size_t GZBUF_SIZE = 1024 * 1024;

// gzopen reads uncompressed files transparently, so one reader covers both
class TextLineReader {
public:
    explicit TextLineReader(const std::string& path) : path_(path) {
        gz_ = gzopen(path.c_str(), "rb");
        if (!gz_) {
            throw std::runtime_error("Failed to open file: " + path);
        }
        gzbuffer(gz_, GZBUF_SIZE);
    }

    ~TextLineReader() {
        if (gz_) gzclose(gz_);
    }

    TextLineReader(const TextLineReader&) = delete;
    TextLineReader& operator=(const TextLineReader&) = delete;

    bool getline(std::string& line) {
        line.clear();
        while (gzgets(gz_, buffer_, sizeof(buffer_))) {
            size_t len = strlen(buffer_);
            const bool complete = len > 0 && buffer_[len - 1] == '\n';
            if (complete) --len;
            line.append(buffer_, len);
            if (complete) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                return true;
            }
        }
        int errnum = 0;
        const char* msg = gzerror(gz_, &errnum);
        if (errnum != Z_OK && errnum != Z_BUF_ERROR) {
            throw std::runtime_error("Read error in " + path_ + ": " + (msg ? msg : "unknown"));
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return !line.empty();
    }

private:
    std::string path_;
    gzFile gz_ = nullptr;
    char buffer_[65536];
};

bool is_blank(const std::string& line) {
    for (char c : line) {
        if (c != ' ' && c != '\t') return false;
    }
    return true;
}

bool parse_double(const char* begin, const char* end, double& out) {
    while (begin < end && (*begin == ' ' || *begin == '\t')) ++begin;
    while (end > begin && (end[-1] == ' ' || end[-1] == '\t')) --end;
    if (begin == end) return false;
    std::string field(begin, end);
    char* parse_end = nullptr;
    errno = 0;
    out = std::strtod(field.c_str(), &parse_end);
    return errno == 0 && parse_end == field.c_str() + field.size() && std::isfinite(out);
}

}  // namespace

bool parse_numeric_fields(const std::string& line, std::vector<double>& out) {
    out.clear();
    const char* p = line.data();
    const char* end = p + line.size();
    double v = 0.0;

    char sep = 0;
    if (line.find(',') != std::string::npos) {
        sep = ',';
    } else if (line.find('\t') != std::string::npos) {
        sep = '\t';
    }

    if (sep) {
        const char* start = p;
        for (const char* c = p; c <= end; ++c) {
            if (c == end || *c == sep) {
                if (!parse_double(start, c, v)) return false;
                out.push_back(v);
                start = c + 1;
            }
        }
        return true;
    }

    // Whitespace separated; runs of spaces collapse
    const char* c = p;
    while (c < end) {
        while (c < end && *c == ' ') ++c;
        if (c == end) break;
        const char* start = c;
        while (c < end && *c != ' ') ++c;
        if (!parse_double(start, c, v)) return false;
        out.push_back(v);
    }
    return !out.empty();
}

Dataset load_dataset(const std::string& path, bool labelled) {
    TextLineReader reader(path);
    Dataset ds;

    std::string line;
    std::vector<double> fields;
    size_t line_no = 0;
    bool first_content_line = true;
    size_t n_columns = 0;

    while (reader.getline(line)) {
        ++line_no;
        if (line.empty() || is_blank(line) || line[0] == '#') continue;

        if (!parse_numeric_fields(line, fields)) {
            if (first_content_line) {
                // Header
                first_content_line = false;
                continue;
            }
            throw std::runtime_error(path + ":" + std::to_string(line_no) + ": non-numeric field");
        }
        first_content_line = false;

        if (n_columns == 0) {
            n_columns = fields.size();
            if (labelled && n_columns < 2) {
                throw std::runtime_error(path + ":" + std::to_string(line_no) +
                                         ": labelled rows need at least one feature and a label");
            }
            ds.n_features = labelled ? n_columns - 1 : n_columns;
        } else if (fields.size() != n_columns) {
            throw std::runtime_error(path + ":" + std::to_string(line_no) + ": expected " +
                                     std::to_string(n_columns) + " columns, found " +
                                     std::to_string(fields.size()));
        }

        FeatureVector row(ds.n_features);
        for (size_t f = 0; f < ds.n_features; ++f) {
            if (std::abs(fields[f]) > std::numeric_limits<float>::max()) {
                throw std::runtime_error(path + ":" + std::to_string(line_no) + ": feature " +
                                         std::to_string(f) + " out of float range");
            }
            row[f] = static_cast<float>(fields[f]);
        }
        ds.rows.push_back(std::move(row));

        if (labelled) {
            const double raw = fields.back();
            if (raw != std::floor(raw)) {
                throw std::runtime_error(path + ":" + std::to_string(line_no) +
                                         ": label is not an integer");
            }
            if (raw < static_cast<double>(std::numeric_limits<Label>::min()) ||
                raw > static_cast<double>(std::numeric_limits<Label>::max())) {
                throw std::runtime_error(path + ":" + std::to_string(line_no) +
                                         ": label out of range");
            }
            ds.labels.push_back(static_cast<Label>(raw));
        }
    }

    return ds;
}

}  // namespace knora
