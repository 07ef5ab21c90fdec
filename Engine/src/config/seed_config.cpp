#include <config/seed_config.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <utils/unicode.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <ctime>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace Seed {

int current_year() {
    std::time_t now = std::time(nullptr);
    std::tm utc{};
    gmtime_r(&now, &utc);
    return utc.tm_year + 1900;
}

ExtractionConfig::ExtractionConfig()
    : minimum_year(current_year() - 25), maximum_year(current_year()) {}

GlossSelection parse_gloss_selection(const std::string& value) {
    std::string v = trim_lower(value);
    if (v == "first") return GlossSelection::First;
    if (v == "last") return GlossSelection::Last;
    throw ConfigError("gloss selection must be 'first' or 'last', got '" + value + "'");
}

std::string to_string(GlossSelection gloss) {
    return gloss == GlossSelection::First ? "first" : "last";
}

namespace {

template <typename T>
void read_field(const json& section, const char* key, T& target, const std::string& where) {
    if (!section.contains(key)) return;
    try {
        target = section.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(where + "." + key + ": " + e.what());
    }
}

int parse_int(const std::string& name, const std::string& value) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigError(name + " expects an integer, got '" + value + "'");
    }
}

size_t parse_size(const std::string& name, const std::string& value) {
    try {
        size_t used = 0;
        unsigned long long v = std::stoull(value, &used);
        if (used != value.size() || value.find('-') != std::string::npos) throw std::invalid_argument(value);
        return static_cast<size_t>(v);
    } catch (const std::exception&) {
        throw ConfigError(name + " expects a non-negative integer, got '" + value + "'");
    }
}

double parse_double(const std::string& name, const std::string& value) {
    try {
        size_t used = 0;
        double v = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception&) {
        throw ConfigError(name + " expects a number, got '" + value + "'");
    }
}

} // namespace

void SeedConfig::apply_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config file " + path.string());
    }

    json root;
    try {
        in >> root;
    } catch (const json::exception& e) {
        throw ConfigError(path.string() + ": " + e.what());
    }
    if (!root.is_object()) {
        throw ConfigError(path.string() + ": top level must be an object");
    }

    if (root.contains("extraction")) {
        const json& s = root["extraction"];
        read_field(s, "minimum_year", extraction.minimum_year, "extraction");
        read_field(s, "maximum_year", extraction.maximum_year, "extraction");
        read_field(s, "languages", extraction.languages, "extraction");
        std::string gloss;
        read_field(s, "gloss", gloss, "extraction");
        if (!gloss.empty()) extraction.gloss = parse_gloss_selection(gloss);
    }

    if (root.contains("matching")) {
        const json& s = root["matching"];
        read_field(s, "threshold", matching.threshold, "matching");
        read_field(s, "gap", matching.gap, "matching");
    }

    if (root.contains("embedding")) {
        const json& s = root["embedding"];
        read_field(s, "model", embedding.model, "embedding");
        read_field(s, "device", embedding.device, "embedding");
        read_field(s, "batch_size", embedding.batch_size, "embedding");
    }

    if (root.contains("io")) {
        const json& s = root["io"];
        read_field(s, "buffer_size", io.buffer_size, "io");
        read_field(s, "progress_interval", io.progress_interval, "io");
        bool strict = io.malformed_lines == MalformedLinePolicy::Abort;
        read_field(s, "strict", strict, "io");
        io.malformed_lines = strict ? MalformedLinePolicy::Abort : MalformedLinePolicy::Skip;
    }
}

void SeedConfig::apply_env() {
    auto env = [](const char* name) -> const char* {
        const char* value = std::getenv(name);
        return (value && *value) ? value : nullptr;
    };

    if (const char* v = env("SEED_MINIMUM_YEAR")) extraction.minimum_year = parse_int("SEED_MINIMUM_YEAR", v);
    if (const char* v = env("SEED_MAXIMUM_YEAR")) extraction.maximum_year = parse_int("SEED_MAXIMUM_YEAR", v);
    if (const char* v = env("SEED_THRESHOLD"))    matching.threshold = parse_double("SEED_THRESHOLD", v);
    if (const char* v = env("SEED_GAP"))          matching.gap = parse_double("SEED_GAP", v);
    if (const char* v = env("SEED_EMBEDDER"))     embedding.model = v;
    if (const char* v = env("SEED_DEVICE"))       embedding.device = v;
    if (const char* v = env("SEED_BUFFER_SIZE"))  io.buffer_size = parse_size("SEED_BUFFER_SIZE", v);
}

std::vector<std::string> SeedConfig::apply_arguments(const std::vector<std::string>& args) {
    std::vector<std::string> positional;
    bool languages_replaced = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) throw ConfigError(arg + " requires a value");
            return args[++i];
        };

        if (arg == "--minimum-year")           extraction.minimum_year = parse_int(arg, value());
        else if (arg == "--maximum-year")      extraction.maximum_year = parse_int(arg, value());
        else if (arg == "--gloss")             extraction.gloss = parse_gloss_selection(value());
        else if (arg == "--language") {
            if (!languages_replaced) { extraction.languages.clear(); languages_replaced = true; }
            extraction.languages.push_back(value());
        }
        else if (arg == "--threshold")         matching.threshold = parse_double(arg, value());
        else if (arg == "--gap")               matching.gap = parse_double(arg, value());
        else if (arg == "--embedder")          embedding.model = value();
        else if (arg == "--device")            embedding.device = value();
        else if (arg == "--batch-size")        embedding.batch_size = parse_size(arg, value());
        else if (arg == "--buffer-size")       io.buffer_size = parse_size(arg, value());
        else if (arg == "--progress-interval") io.progress_interval = parse_size(arg, value());
        else if (arg == "--strict")            io.malformed_lines = MalformedLinePolicy::Abort;
        else if (arg == "--config")            value(); // consumed by load()
        else if (arg == "--no-color" || arg == "--quiet") {}
        else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            throw ConfigError("unknown option " + arg);
        }
        else positional.push_back(arg);
    }

    return positional;
}

void SeedConfig::validate() const {
    if (extraction.minimum_year > extraction.maximum_year) {
        throw ConfigError("minimum_year (" + std::to_string(extraction.minimum_year) +
                          ") is after maximum_year (" + std::to_string(extraction.maximum_year) + ")");
    }
    if (extraction.languages.empty()) {
        throw ConfigError("at least one source language is required");
    }
    if (matching.threshold < -1.0 || matching.threshold > 1.0) {
        throw ConfigError("threshold must lie in [-1, 1]");
    }
    if (matching.gap < 0.0) {
        throw ConfigError("gap must not be negative");
    }
    if (embedding.model.empty()) {
        throw ConfigError("embedder model must not be empty");
    }
    if (embedding.batch_size == 0) {
        throw ConfigError("batch_size must be positive");
    }
    if (io.buffer_size == 0) {
        throw ConfigError("buffer_size must be positive");
    }
}

SeedConfig SeedConfig::load(int argc, char** argv, std::vector<std::string>& positional) {
    std::vector<std::string> args(argv + 1, argv + argc);

    SeedConfig config;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) throw ConfigError("--config requires a value");
            config.apply_file(args[i + 1]);
        } else if (args[i] == "--no-color") {
            Logger::set_color(false);
        } else if (args[i] == "--quiet") {
            Logger::set_min_level(Logger::Level::Warning);
        }
    }
    if (std::getenv("NO_COLOR")) Logger::set_color(false);

    config.apply_env();
    positional = config.apply_arguments(args);
    config.validate();
    return config;
}

std::string SeedConfig::usage() {
    std::ostringstream oss;
    oss << "Options:\n"
        << "  --config <file>            JSON configuration file\n"
        << "  --minimum-year <year>      Oldest accepted quotation year\n"
        << "  --maximum-year <year>      Newest accepted quotation year\n"
        << "  --gloss first|last         Which gloss becomes the definition\n"
        << "  --language <code>          Source language filter (repeatable)\n"
        << "  --threshold <score>        Minimum cosine score for a match\n"
        << "  --gap <score>              Minimum lead over the second best sense\n"
        << "  --embedder <model>         'hashing[:dim]' or a static embedding model directory\n"
        << "  --device <device>          Embedding device (cpu)\n"
        << "  --batch-size <n>           Rows encoded per embedding block\n"
        << "  --buffer-size <bytes>      Output buffer size\n"
        << "  --progress-interval <n>    Records between progress lines (0 = off)\n"
        << "  --strict                   Abort on malformed input lines\n"
        << "  --no-color                 Plain log output\n"
        << "  --quiet                    Only warnings and errors\n";
    return oss.str();
}

} // namespace Seed
