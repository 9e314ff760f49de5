#include "recall_cli/cli_handler.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>

namespace recall_cli {

namespace {

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw CliError("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// Flag/value pairs following the command word.
void parse_flags(int argc, char* argv[], CliOptions& options) {
    for (int i = 2; i < argc; i += 2) {
        std::string flag = argv[i];
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        std::string value = argv[i + 1];

        if (flag == "--owner" || flag == "-o") {
            options.owner_id = value;
        } else if (flag == "--document" || flag == "-d") {
            options.document_id = value;
        } else if (flag == "--file" || flag == "-f") {
            options.file_path = value;
        } else if (flag == "--type" || flag == "-t") {
            options.source_type = value;
        } else if (flag == "--link" || flag == "-l") {
            options.link = value;
        } else if (flag == "--title") {
            options.title = value;
        } else if (flag == "--query" || flag == "-q") {
            options.query = value;
        } else if (flag == "--top-k" || flag == "-k") {
            try {
                options.top_k = std::stoi(value);
            } catch (const std::exception&) {
                throw CliError("--top-k expects a number, got: " + value);
            }
        } else if (flag == "--id" || flag == "-i") {
            options.job_id = value;
        } else {
            throw CliError("Unknown flag: " + flag);
        }
    }
}

void require(const std::string& value, const std::string& message) {
    if (value.empty()) {
        throw CliError(message);
    }
}

}  // namespace

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_))
    , curl_handle_(other.curl_handle_) {
    other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
    if (this != &other) {
        if (curl_handle_) {
            curl_easy_cleanup(curl_handle_);
        }
        api_base_url_ = std::move(other.api_base_url_);
        curl_handle_ = other.curl_handle_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;
    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];
    if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    }

    parse_flags(argc, argv, options);

    if (command == "ingest" || command == "i") {
        options.command = Command::Ingest;
        require(options.owner_id, "Ingest requires --owner. Usage: ingest --owner <id> --document <id> --file <path>");
        require(options.document_id, "Ingest requires --document. Usage: ingest --owner <id> --document <id> --file <path>");
        require(options.file_path, "Ingest requires --file. Usage: ingest --owner <id> --document <id> --file <path>");
        if (options.source_type != "plain" && options.source_type != "file" && options.source_type != "page") {
            throw CliError("--type must be one of plain, file, page");
        }
    } else if (command == "search" || command == "s") {
        options.command = Command::Search;
        require(options.owner_id, "Search requires --owner. Usage: search --owner <id> --query <query>");
        require(options.query, "Search requires --query. Usage: search --owner <id> --query <query>");
    } else if (command == "job" || command == "j") {
        options.command = Command::Job;
        require(options.job_id, "Job requires --id. Usage: job --id <job_id>");
    } else if (command == "cancel" || command == "c") {
        options.command = Command::Cancel;
        require(options.job_id, "Cancel requires --id. Usage: cancel --id <job_id>");
    } else if (command == "delete" || command == "d") {
        options.command = Command::Delete;
        require(options.owner_id, "Delete requires --owner. Usage: delete --owner <id> [--document <id>]");
    } else if (command == "documents" || command == "ls") {
        options.command = Command::Documents;
        require(options.owner_id, "Documents requires --owner. Usage: documents --owner <id>");
    } else if (command == "repair" || command == "r") {
        options.command = Command::Repair;
        require(options.owner_id, "Repair requires --owner. Usage: repair --owner <id>");
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

nlohmann::json CliHandler::build_ingestion_body(const CliOptions& options, const std::string& contents) {
    std::vector<std::string> pages;
    size_t start = 0;
    while (true) {
        size_t end = contents.find('\f', start);
        pages.push_back(contents.substr(start, end == std::string::npos ? std::string::npos : end - start));
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }

    const bool paginated = options.source_type == "file" || pages.size() > 1;
    nlohmann::json pages_json = nlohmann::json::array();
    for (size_t i = 0; i < pages.size(); ++i) {
        nlohmann::json page = {{"text", pages[i]}};
        if (paginated) {
            page["page_number"] = static_cast<int>(i) + 1;
        }
        pages_json.push_back(page);
    }

    nlohmann::json source;
    if (options.source_type == "file") {
        std::string file_name = options.title;
        if (file_name.empty()) {
            size_t slash = options.file_path.find_last_of('/');
            file_name = slash == std::string::npos ? options.file_path : options.file_path.substr(slash + 1);
        }
        source = {{"type", "uploaded_file"}, {"file_name", file_name}, {"file_url", options.link}};
    } else if (options.source_type == "page") {
        source = {{"type", "synced_page"},
                  {"page_id", options.document_id},
                  {"page_url", options.link},
                  {"title", options.title}};
    } else {
        source = {{"type", "plain_text"},
                  {"label", options.title.empty() ? options.document_id : options.title}};
    }

    return {{"owner_id", options.owner_id},
            {"document_id", options.document_id},
            {"source", source},
            {"pages", pages_json}};
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Ingest:
            handle_ingest_command(options);
            break;
        case Command::Search:
            handle_search_command(options);
            break;
        case Command::Job:
            handle_job_command(options);
            break;
        case Command::Cancel:
            handle_cancel_command(options);
            break;
        case Command::Delete:
            handle_delete_command(options);
            break;
        case Command::Documents:
            handle_documents_command(options);
            break;
        case Command::Repair:
            handle_repair_command(options);
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::handle_ingest_command(const CliOptions& options) {
    std::cout << "Ingesting " << options.file_path << " as document '" << options.document_id << "'" << std::endl;
    nlohmann::json body = build_ingestion_body(options, read_file(options.file_path));
    nlohmann::json response = make_post_request("/documents", body);
    std::cout << "Queued as job " << response.value("job_id", 0LL) << std::endl;
}

void CliHandler::handle_search_command(const CliOptions& options) {
    std::cout << "Search for: " << options.query << std::endl;
    nlohmann::json request_data = {
        {"owner_id", options.owner_id},
        {"query", options.query},
        {"highlight", true}
    };
    if (options.top_k) {
        request_data["top_k"] = *options.top_k;
    }
    print_search_response(make_post_request("/search", request_data));
}

void CliHandler::handle_job_command(const CliOptions& options) {
    print_job_response(make_get_request("/jobs/" + escape(options.job_id)));
}

void CliHandler::handle_cancel_command(const CliOptions& options) {
    print_json_response(make_post_request("/jobs/" + escape(options.job_id) + "/cancel", nlohmann::json::object()));
}

void CliHandler::handle_delete_command(const CliOptions& options) {
    std::string endpoint = "/owners/" + escape(options.owner_id);
    if (!options.document_id.empty()) {
        endpoint += "/documents/" + escape(options.document_id);
    }
    nlohmann::json response = make_delete_request(endpoint);
    std::cout << "Deleted " << response.value("deleted_chunks", 0) << " chunks." << std::endl;
}

void CliHandler::handle_documents_command(const CliOptions& options) {
    nlohmann::json response = make_get_request("/owners/" + escape(options.owner_id) + "/documents");
    const auto& documents = response["data"]["documents"];
    if (documents.empty()) {
        std::cout << "No documents." << std::endl;
        return;
    }
    for (const auto& doc : documents) {
        std::cout << std::left << std::setw(36) << doc.value("document_id", "")
                  << std::setw(8) << doc.value("chunk_count", 0)
                  << doc.value("source_title", "") << std::endl;
    }
}

void CliHandler::handle_repair_command(const CliOptions& options) {
    nlohmann::json response = make_post_request("/owners/" + escape(options.owner_id) + "/repair", nlohmann::json::object());
    std::cout << "Repaired " << response.value("repaired", 0) << " chunks, "
              << response.value("remaining", 0) << " still degraded." << std::endl;
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    return perform_request("GET", endpoint, std::nullopt);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    return perform_request("POST", endpoint, data);
}

nlohmann::json CliHandler::make_delete_request(const std::string& endpoint) {
    return perform_request("DELETE", endpoint, std::nullopt);
}

nlohmann::json CliHandler::perform_request(const std::string& method,
                                           const std::string& endpoint,
                                           const std::optional<nlohmann::json>& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string request_json = data ? data->dump() : std::string();
    std::string response_buffer;
    std::unique_ptr<curl_slist, SlistDeleter> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"));

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);
    if (method == "POST") {
        curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
        curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
    } else if (method != "GET") {
        curl_easy_setopt(curl_handle_, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
    nlohmann::json body = nlohmann::json::parse(response_buffer, nullptr, false);
    if (http_code < 200 || http_code >= 300) {
        std::string detail = body.is_object() ? body.value("error", std::string()) : std::string();
        throw CliError("HTTP request failed with status code: " + std::to_string(http_code) +
                       (detail.empty() ? "" : " (" + detail + ")"));
    }
    if (body.is_discarded()) {
        throw CliError("Server returned a response that is not JSON");
    }
    return body;
}

std::string CliHandler::escape(const std::string& segment) {
    char* escaped = curl_easy_escape(curl_handle_, segment.c_str(), static_cast<int>(segment.size()));
    if (!escaped) {
        throw CliError("Failed to URL-encode: " + segment);
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

void CliHandler::set_api_base_url(const std::string& url) {
    api_base_url_ = url;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

void CliHandler::print_json_response(const nlohmann::json& response) {
    std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_search_response(const nlohmann::json& response) {
    const auto& results = response["results"];
    const size_t always_shown = response.value("always_shown", static_cast<size_t>(2));
    std::cout << "\n=== " << response.value("total", 0) << " sources ===" << std::endl;

    for (size_t i = 0; i < results.size(); ++i) {
        if (i == always_shown) {
            std::cout << "\n--- more sources ---" << std::endl;
        }
        const auto& result = results[i];
        const auto& source = result["source"];
        std::cout << "\n" << (i + 1) << ". " << source.value("displayName", "")
                  << "  [score " << std::fixed << std::setprecision(3) << result.value("score", 0.0)
                  << ", " << result.value("chunkCount", 0) << " chunks]" << std::endl;
        if (source.contains("url") && source["url"].is_string()) {
            std::cout << "   " << source["url"].get<std::string>() << std::endl;
        }
        std::cout << "   " << result.value("text", "") << std::endl;
    }
}

void CliHandler::print_job_response(const nlohmann::json& response) {
    const auto& job = response["data"];
    std::cout << "Job " << job.value("id", 0LL) << ": " << job.value("status", "") << std::endl;
    if (job.contains("progress") && job["progress"].is_object()) {
        const auto& progress = job["progress"];
        std::cout << "  " << progress.value("message", "") << " (" << std::fixed << std::setprecision(0)
                  << progress.value("percent", 0.0) * 100 << "%)" << std::endl;
        std::cout << "  pages " << progress.value("processed_pages", 0) << "/" << progress.value("total_pages", 0)
                  << ", chunks " << progress.value("stored_chunks", 0) << "/" << progress.value("total_chunks", 0)
                  << std::endl;
    }
    if (job.contains("error_message") && job["error_message"].is_string()) {
        print_error(job["error_message"].get<std::string>() +
                    (job.value("retryable", false) ? " (retryable)" : ""));
    }
    if (job.contains("summary") && job["summary"].is_object()) {
        std::cout << "Summary:" << std::endl;
        print_json_response(job["summary"]);
    }
}

void CliHandler::print_error(const std::string& error) {
    std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_help() {
    std::cout << "Recall CLI\n\n"
              << "Usage: recall_cli <command> [flags]\n\n"
              << "Commands:\n"
              << "  ingest     --owner O --document D --file F [--type plain|file|page] [--link URL] [--title T]\n"
              << "             Pages in F are separated by form feeds.\n"
              << "  search     --owner O --query Q [--top-k K]\n"
              << "  job        --id N        Show job status, progress and summary\n"
              << "  cancel     --id N        Cancel a pending or running job\n"
              << "  delete     --owner O [--document D]\n"
              << "  documents  --owner O     List ingested documents\n"
              << "  repair     --owner O     Re-embed chunks stored with fallback vectors\n"
              << "  help\n\n"
              << "Environment:\n"
              << "  RECALL_API_URL  API base URL (default http://127.0.0.1:3030)\n";
}

std::string CliHandler::build_url(const std::string& endpoint) {
    std::string base = api_base_url_;
    if (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + endpoint;
}

}  // namespace recall_cli
