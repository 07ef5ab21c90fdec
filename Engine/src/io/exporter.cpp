#include <io/exporter.hpp>
#include <utils/errors.hpp>
#include <utils/unicode.hpp>

#include <cerrno>
#include <cstring>
#include <system_error>

namespace Seed {

Exporter::Exporter(std::filesystem::path output_path, size_t buffer_size)
    : output_path_(std::move(output_path)), buffer_size_(buffer_size) {
    auto parent = output_path_.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw IoError("cannot create " + parent.string() + ": " + ec.message());
        }
    }
}

JsonlExporter::JsonlExporter(std::filesystem::path output_path, size_t buffer_size)
    : Exporter(std::move(output_path), buffer_size), buffer_(buffer_size > 0 ? buffer_size : 1) {
    // The buffer must be installed before the file is opened
    out_.rdbuf()->pubsetbuf(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
    out_.open(output_path_, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out_) {
        throw IoError("cannot open " + output_path_.string() + " for writing: " + std::strerror(errno));
    }
}

JsonlExporter::~JsonlExporter() {
    if (!finished_ && out_.is_open()) out_.close();
}

void JsonlExporter::write(const ojson& record) {
    out_ << record.dump(-1, ' ', false, ojson::error_handler_t::replace) << '\n';
    if (!out_) {
        throw IoError("write failed on " + output_path_.string());
    }
    ++records_written_;
}

std::filesystem::path JsonlExporter::finish() {
    if (!finished_) {
        finished_ = true;
        out_.flush();
        bool ok = static_cast<bool>(out_);
        out_.close();
        if (!ok || out_.fail()) {
            throw IoError("failed to write " + output_path_.string());
        }
    }
    return output_path_;
}

std::map<std::string, ExporterFactory::Creator>& ExporterFactory::registry() {
    static std::map<std::string, Creator> creators = {
        {DEFAULT_EXTENSION, [](const std::filesystem::path& p, size_t buffer_size) -> std::unique_ptr<Exporter> {
            return std::make_unique<JsonlExporter>(p, buffer_size);
        }}
    };
    return creators;
}

void ExporterFactory::register_exporter(const std::string& extension, Creator creator) {
    registry()[to_lower(extension)] = std::move(creator);
}

bool ExporterFactory::supports(const std::string& extension) {
    return registry().count(to_lower(extension)) > 0;
}

std::unique_ptr<Exporter> ExporterFactory::create(std::filesystem::path output_path, size_t buffer_size) {
    std::string extension = output_path.extension().string();
    if (!extension.empty() && extension.front() == '.') extension.erase(0, 1);
    extension = to_lower(extension);

    auto& creators = registry();
    auto it = creators.find(extension);
    if (it == creators.end()) {
        it = creators.find(DEFAULT_EXTENSION);
        if (it == creators.end()) {
            throw IoError("no default exporter registered");
        }
        output_path.replace_extension(std::string(".") + DEFAULT_EXTENSION);
    }
    return it->second(output_path, buffer_size);
}

} // namespace Seed
