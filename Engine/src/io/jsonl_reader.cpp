#include <io/jsonl_reader.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace Seed {

namespace {

constexpr size_t MAX_MALFORMED_WARNINGS = 10;

} // namespace

JsonlReader::JsonlReader(const std::string& path, MalformedLinePolicy policy, size_t buffer_size)
    : path_(path), policy_(policy), chunk_(64 * 1024, '\0') {
    file_ = gzopen(path_.c_str(), "rb");
    if (!file_) {
        throw IoError("cannot open " + path_ + ": " + std::strerror(errno));
    }
    if (buffer_size >= 8192) {
        gzbuffer(file_, static_cast<unsigned>(std::min<size_t>(buffer_size, 1u << 30)));
    }
    // gzdirect() is only meaningful once the header has been looked at
    int c = gzgetc(file_);
    if (c != -1) gzungetc(c, file_);
    compressed_ = gzdirect(file_) == 0;
}

JsonlReader::~JsonlReader() {
    if (file_) gzclose(file_);
}

bool JsonlReader::read_line(std::string& line) {
    line.clear();
    while (true) {
        char* got = gzgets(file_, chunk_.data(), static_cast<int>(chunk_.size()));
        if (!got) {
            int err = Z_OK;
            const char* msg = gzerror(file_, &err);
            if (err != Z_OK) {
                throw IoError(path_ + ": read failed: " + msg);
            }
            // Final line without a trailing newline still counts
            return !line.empty();
        }
        size_t len = std::strlen(got);
        line.append(got, len);
        if (len > 0 && got[len - 1] == '\n') {
            line.pop_back();
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
    }
}

bool JsonlReader::next(ojson& record) {
    std::string line;
    while (read_line(line)) {
        ++line_number_;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        std::string problem;
        try {
            record = ojson::parse(line);
            if (!record.is_object()) problem = "expected a JSON object, got " + std::string(record.type_name());
        } catch (const nlohmann::json::parse_error& e) {
            problem = e.what();
        }

        ++records_;
        if (problem.empty()) return true;

        ++malformed_;
        if (policy_ == MalformedLinePolicy::Abort) {
            throw ParseError(path_, line_number_, problem);
        }
        if (malformed_ <= MAX_MALFORMED_WARNINGS) {
            Logger::warn(path_ + ":" + std::to_string(line_number_) + ": skipping malformed line");
        } else if (malformed_ == MAX_MALFORMED_WARNINGS + 1) {
            Logger::warn(path_ + ": further malformed lines are counted but not reported");
        }
        record = ojson::object();
        return true;
    }
    return false;
}

} // namespace Seed
