#include "bulkcp/copy_config.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <type_traits>
#include <iostream>
#include <nlohmann/json.hpp>

namespace bulkcp {

// --- BackendConfig ---

std::string BackendConfig::validate() const {
    auto has = [&](const char* key) {
        auto it = params.find(key);
        return it != params.end() && !it->second.empty();
    };

    for (const char* key : {"connect_timeout", "request_timeout", "max_retries"}) {
        if (!has(key)) continue;
        const auto& v = params.at(key);
        if (v.find_first_not_of("0123456789") != std::string::npos)
            return std::string(key) + " must be a non-negative integer: " + v;
    }

    if (type == "s3") {
        if (has("access_key") != has("secret_key"))
            return "s3 backend requires both 'access_key' and 'secret_key' (or neither)";
    } else if (type == "azure") {
        if (has("account_key") && has("sas_token"))
            return "azure backend takes 'account_key' or 'sas_token', not both";
    } else if (type == "gcs") {
        if (has("credentials_file") && !std::filesystem::exists(params.at("credentials_file")))
            return "gcs credentials file does not exist: " + params.at("credentials_file");
    } else {
        return "unknown backend type: " + type;
    }
    return {};
}

// --- requester-pays project ---

bool decode_requester_pays_project(const std::string& json, std::string& project,
                                   std::string& error) {
    try {
        auto j = nlohmann::json::parse(json);
        if (j.is_null()) {
            project.clear();
            return true;
        }
        if (j.is_string()) {
            project = j.get<std::string>();
            return true;
        }
        error = "expected a JSON string or null, got " + std::string(j.type_name());
    } catch (const std::exception& e) {
        error = std::string("invalid JSON: ") + e.what();
    }
    return false;
}

// --- CopyConfig ---

namespace {

// Value-taking backend flags: --<type>-<suffix> <value>
const std::map<std::string, std::string>& backend_value_flags(const std::string& type) {
    static const std::map<std::string, std::map<std::string, std::string>> flags = {
        {"s3", {
            {"region", "region"},
            {"endpoint", "endpoint"},
            {"access-key", "access_key"},
            {"secret-key", "secret_key"},
            {"session-token", "session_token"},
            {"ca-bundle", "ca_bundle"},
            {"connect-timeout", "connect_timeout"},
            {"request-timeout", "request_timeout"},
            {"max-retries", "max_retries"},
        }},
        {"azure", {
            {"endpoint", "endpoint"},
            {"account-key", "account_key"},
            {"sas-token", "sas_token"},
            {"ca-bundle", "ca_bundle"},
            {"connect-timeout", "connect_timeout"},
            {"request-timeout", "request_timeout"},
            {"max-retries", "max_retries"},
        }},
        {"gcs", {
            {"endpoint", "endpoint"},
            {"credentials-file", "credentials_file"},
            {"ca-bundle", "ca_bundle"},
            {"connect-timeout", "connect_timeout"},
            {"request-timeout", "request_timeout"},
            {"max-retries", "max_retries"},
        }},
    };
    return flags.at(type);
}

// Boolean backend flags (no value argument): --<type>-<suffix>
const std::map<std::string, std::pair<std::string, std::string>>&
backend_bool_flags(const std::string& type) {
    static const std::map<std::string, std::map<std::string, std::pair<std::string, std::string>>>
        flags = {
            {"s3", {
                {"no-verify-ssl", {"verify_ssl", "false"}},
                {"path-style", {"use_path_style", "true"}},
                {"unsigned-payload", {"unsigned_payload", "true"}},
            }},
            {"azure", {
                {"no-verify-ssl", {"verify_ssl", "false"}},
            }},
            {"gcs", {
                {"no-verify-ssl", {"verify_ssl", "false"}},
            }},
        };
    return flags.at(type);
}

// Split "--s3-region" into the backend it targets and "region".
// Returns nullptr if the flag is not a backend flag.
BackendConfig* backend_for_flag(const std::string& arg, CopyConfig& config, std::string& suffix) {
    for (auto* bc : {&config.s3, &config.azure, &config.gcs}) {
        std::string prefix = "--" + bc->type + "-";
        if (arg.compare(0, prefix.size(), prefix) == 0) {
            suffix = arg.substr(prefix.size());
            return bc;
        }
    }
    return nullptr;
}

bool parse_number(const char* value, const std::string& name, uint64_t& out) {
    try {
        size_t consumed = 0;
        std::string s = value;
        if (s.empty() || s[0] == '-') throw std::invalid_argument("negative");
        out = std::stoull(s, &consumed);
        if (consumed != s.size()) throw std::invalid_argument("trailing characters");
        return true;
    } catch (const std::exception&) {
        std::cerr << "Error: invalid value for " << name << ": " << value << "\n";
        return false;
    }
}

std::string json_param_value(const nlohmann::json& val) {
    return val.is_string() ? val.get<std::string>() : val.dump();
}

void set_from_env(BackendParams& params, const char* key, const char* env) {
    auto it = params.find(key);
    if (it != params.end() && !it->second.empty()) return;
    if (const char* v = std::getenv(env)) {
        if (*v) params[key] = v;
    }
}

bool has_param(const BackendParams& params, const char* key) {
    auto it = params.find(key);
    return it != params.end() && !it->second.empty();
}

void print_usage() {
    std::cerr <<
        "Usage: bulkcp <requester_pays_project> [files] [options]\n"
        "\n"
        "Positional:\n"
        "  requester_pays_project           JSON string or null: project billed for\n"
        "                                   requester-pays buckets\n"
        "  files                            JSON array of {\"from\": .., \"to\": ..} or\n"
        "                                   {\"from\": .., \"into\": ..} objects.\n"
        "                                   Read from stdin when absent or \"-\".\n"
        "\n"
        "Copy options:\n"
        "  --max-simultaneous-transfers <N> Most tasks moving bytes at once (default: 75)\n"
        "  --worker-threads <N>             Worker threads (default: same as above)\n"
        "  --part-size <bytes>              Split objects larger than this (default: 134217728)\n"
        "  --chunk-size <bytes>             Copy buffer size (default: 8388608)\n"
        "  --timeout <secs>                 Cancel the batch after this long (default: none)\n"
        "  --cancel-grace <secs>            Wait for in-flight tasks after cancellation (default: 30)\n"
        "  --config <path>                  JSON config file\n"
        "  -v, --verbose                    Verbose output and progress\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "\n"
        "S3 (s3://bucket/key):\n"
        "  --s3-region <region>             Region (default: us-east-1, or AWS_REGION env)\n"
        "  --s3-endpoint <url>              Custom endpoint (MinIO etc.)\n"
        "  --s3-access-key <key>            Access key (or AWS_ACCESS_KEY_ID env)\n"
        "  --s3-secret-key <key>            Secret key (or AWS_SECRET_ACCESS_KEY env)\n"
        "  --s3-session-token <token>       Session token (or AWS_SESSION_TOKEN env)\n"
        "  --s3-path-style                  Use path-style URLs\n"
        "  --s3-unsigned-payload            Do not hash request bodies\n"
        "\n"
        "Azure Blob (hail-az://account/container/blob, https://account.blob.core.windows.net/...):\n"
        "  --azure-endpoint <url>           Custom endpoint\n"
        "  --azure-account-key <key>        Shared key (or AZURE_STORAGE_KEY env)\n"
        "  --azure-sas-token <token>        SAS token (or AZURE_STORAGE_SAS_TOKEN env)\n"
        "\n"
        "GCS (gs://bucket/object):\n"
        "  --gcs-endpoint <url>             Custom endpoint\n"
        "  --gcs-credentials-file <path>    Service account key (or GOOGLE_APPLICATION_CREDENTIALS env)\n"
        "\n"
        "Every backend also takes:\n"
        "  --<backend>-ca-bundle <path>     CA certificate bundle\n"
        "  --<backend>-no-verify-ssl        Skip SSL verification\n"
        "  --<backend>-connect-timeout <s>  Connect timeout (default: 10)\n"
        "  --<backend>-request-timeout <s>  Request timeout (default: 300)\n"
        "  --<backend>-max-retries <N>      Retries for transient failures (default: 3)\n"
        "\n"
        "  -h, --help                       Show this help\n";
}

}  // namespace

std::optional<CopyConfig> CopyConfig::from_args(int argc, char* argv[]) {
    CopyConfig config;
    int positional = 0;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    auto next_number = [&](int& i, const char* name, auto& out) -> bool {
        auto* v = next_arg(i, name);
        if (!v) return false;
        uint64_t n = 0;
        if (!parse_number(v, name, n)) return false;
        out = static_cast<std::remove_reference_t<decltype(out)>>(n);
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Positionals ("-" is the files positional meaning stdin)
        if (arg.empty() || arg[0] != '-' || arg == "-") {
            if (positional == 0) {
                config.requester_pays_project_json = arg;
            } else if (positional == 1) {
                if (arg != "-") config.files_json = arg;
            } else {
                std::cerr << "Error: unexpected argument: " << arg << "\n";
                return std::nullopt;
            }
            ++positional;
            continue;
        }

        // Backend flags (--s3-X / --azure-X / --gcs-X)
        std::string suffix;
        if (auto* bc = backend_for_flag(arg, config, suffix)) {
            const auto& bools = backend_bool_flags(bc->type);
            if (auto b = bools.find(suffix); b != bools.end()) {
                bc->params[b->second.first] = b->second.second;
                continue;
            }
            const auto& values = backend_value_flags(bc->type);
            auto v = values.find(suffix);
            if (v == values.end()) {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
            auto* value = next_arg(i, arg.c_str());
            if (!value) return std::nullopt;
            bc->params[v->second] = value;
            continue;
        }

        if (arg == "--max-simultaneous-transfers") {
            if (!next_number(i, "--max-simultaneous-transfers", config.max_simultaneous_transfers))
                return std::nullopt;
        } else if (arg == "--worker-threads") {
            if (!next_number(i, "--worker-threads", config.worker_threads)) return std::nullopt;
        } else if (arg == "--part-size") {
            if (!next_number(i, "--part-size", config.part_size)) return std::nullopt;
        } else if (arg == "--chunk-size") {
            if (!next_number(i, "--chunk-size", config.chunk_size)) return std::nullopt;
        } else if (arg == "--timeout") {
            if (!next_number(i, "--timeout", config.timeout_secs)) return std::nullopt;
        } else if (arg == "--cancel-grace") {
            if (!next_number(i, "--cancel-grace", config.cancel_grace_secs)) return std::nullopt;
        } else if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--verbose" || arg == "-v") {
            config.verbose = true;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--metrics-interval") {
            if (!next_number(i, "--metrics-interval", config.metrics_interval_secs))
                return std::nullopt;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return std::nullopt;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    config.apply_defaults();
    return config;
}

bool CopyConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("requester_pays_project"))
            requester_pays_project_json = j["requester_pays_project"].dump();
        if (j.contains("max_simultaneous_transfers"))
            max_simultaneous_transfers = j["max_simultaneous_transfers"].get<size_t>();
        if (j.contains("worker_threads")) worker_threads = j["worker_threads"].get<size_t>();
        if (j.contains("part_size")) part_size = j["part_size"].get<uint64_t>();
        if (j.contains("chunk_size")) chunk_size = j["chunk_size"].get<uint64_t>();
        if (j.contains("timeout")) timeout_secs = j["timeout"].get<size_t>();
        if (j.contains("cancel_grace")) cancel_grace_secs = j["cancel_grace"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        // Backend sections: {"s3": {"region": "us-west-2", ...}, ...}
        for (auto* bc : {&s3, &azure, &gcs}) {
            if (!j.contains(bc->type)) continue;
            auto& jb = j[bc->type];
            if (!jb.is_object()) {
                std::cerr << "Error parsing config: '" << bc->type << "' must be an object\n";
                return false;
            }
            for (auto& [key, val] : jb.items()) {
                bc->params[key] = json_param_value(val);
            }
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void CopyConfig::apply_defaults() {
    set_from_env(s3.params, "access_key", "AWS_ACCESS_KEY_ID");
    set_from_env(s3.params, "secret_key", "AWS_SECRET_ACCESS_KEY");
    set_from_env(s3.params, "session_token", "AWS_SESSION_TOKEN");
    set_from_env(s3.params, "region", "AWS_REGION");
    set_from_env(s3.params, "region", "AWS_DEFAULT_REGION");

    // One Azure credential: an explicit one, else the environment key, else the SAS
    if (!has_param(azure.params, "account_key") && !has_param(azure.params, "sas_token")) {
        set_from_env(azure.params, "account_key", "AZURE_STORAGE_KEY");
        if (!has_param(azure.params, "account_key"))
            set_from_env(azure.params, "sas_token", "AZURE_STORAGE_SAS_TOKEN");
    }

    if (!has_param(gcs.params, "credentials_json"))
        set_from_env(gcs.params, "credentials_file", "GOOGLE_APPLICATION_CREDENTIALS");

    std::string error;
    if (!requester_pays_project_json.empty() &&
        decode_requester_pays_project(requester_pays_project_json, requester_pays_project, error) &&
        !requester_pays_project.empty() && !has_param(gcs.params, "project")) {
        gcs.params["project"] = requester_pays_project;
    }
}

std::string CopyConfig::validate() const {
    if (requester_pays_project_json.empty())
        return "requester_pays_project is required (a JSON string or null)";
    std::string project, error;
    if (!decode_requester_pays_project(requester_pays_project_json, project, error))
        return "requester_pays_project: " + error;

    if (max_simultaneous_transfers == 0) return "max_simultaneous_transfers must be >= 1";
    if (part_size == 0) return "part_size must be >= 1";
    if (chunk_size == 0) return "chunk_size must be >= 1";
    if (!metrics_file.empty() && metrics_interval_secs == 0)
        return "metrics_interval must be >= 1";

    for (const auto* bc : {&s3, &azure, &gcs}) {
        auto err = bc->validate();
        if (!err.empty()) return bc->type + ": " + err;
    }
    return {};
}

std::map<std::string, BackendParams> CopyConfig::router_params() const {
    return {
        {s3.type, s3.params},
        {azure.type, azure.params},
        {gcs.type, gcs.params},
    };
}

CopierOptions CopyConfig::copier_options() const {
    CopierOptions options;
    options.max_simultaneous_transfers = max_simultaneous_transfers;
    options.worker_threads = worker_threads;
    options.part_size = part_size;
    options.chunk_size = static_cast<size_t>(chunk_size);
    options.cancel_grace = std::chrono::seconds(cancel_grace_secs);
    return options;
}

}  // namespace bulkcp
