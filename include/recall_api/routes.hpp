#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "server.hpp"

namespace recall_core {
class IngestionService;
class SearchService;
class DocumentService;
class EmbeddingRepairService;
struct JobStatusView;
struct SearchResponse;
}  // namespace recall_core

namespace recall_api {

class Routes {
 public:
  Routes(std::shared_ptr<recall_core::IngestionService> ingestion_service,
         std::shared_ptr<recall_core::SearchService> search_service,
         std::shared_ptr<recall_core::DocumentService> document_service,
         std::shared_ptr<recall_core::EmbeddingRepairService> repair_service,
         int repair_batch_size);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  void register_routes(Server &server);

  // Response bodies, shared with the CLI's expectations.
  static nlohmann::json job_status_to_json(const recall_core::JobStatusView &view);
  static nlohmann::json search_response_to_json(const recall_core::SearchResponse &response);

 private:
  std::shared_ptr<recall_core::IngestionService> ingestion_service_;
  std::shared_ptr<recall_core::SearchService> search_service_;
  std::shared_ptr<recall_core::DocumentService> document_service_;
  std::shared_ptr<recall_core::EmbeddingRepairService> repair_service_;
  int repair_batch_size_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_submit_document(const crow::request &req);
  crow::response handle_get_job(const crow::request &req, const std::string &job_id);
  crow::response handle_cancel_job(const crow::request &req, const std::string &job_id);
  crow::response handle_search(const crow::request &req);
  crow::response handle_list_documents(const crow::request &req, const std::string &owner_id);
  crow::response handle_delete_document(const crow::request &req,
                                        const std::string &owner_id,
                                        const std::string &document_id);
  crow::response handle_delete_owner(const crow::request &req, const std::string &owner_id);
  crow::response handle_repair(const crow::request &req, const std::string &owner_id);

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace recall_api
