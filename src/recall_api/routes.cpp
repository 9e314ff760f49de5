#include "recall_api/routes.hpp"

#include <iostream>
#include <nlohmann/json.hpp>

#include "recall_core/db/chunk_store.hpp"
#include "recall_core/db/job_repo.hpp"
#include "recall_core/services/document_service.hpp"
#include "recall_core/services/embedding_repair_service.hpp"
#include "recall_core/services/ingestion_service.hpp"
#include "recall_core/services/search_service.hpp"

namespace recall_api {
Routes::Routes(std::shared_ptr<recall_core::IngestionService> ingestion_service,
               std::shared_ptr<recall_core::SearchService> search_service,
               std::shared_ptr<recall_core::DocumentService> document_service,
               std::shared_ptr<recall_core::EmbeddingRepairService> repair_service,
               int repair_batch_size)
    : ingestion_service_(std::move(ingestion_service)),
      search_service_(std::move(search_service)),
      document_service_(std::move(document_service)),
      repair_service_(std::move(repair_service)),
      repair_batch_size_(repair_batch_size) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/documents")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_submit_document(req); });

  CROW_ROUTE(app, "/jobs/<string>")
  ([this](const crow::request &req, const std::string &job_id) {
    return handle_get_job(req, job_id);
  });

  CROW_ROUTE(app, "/jobs/<string>/cancel")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &job_id) {
        return handle_cancel_job(req, job_id);
      });

  CROW_ROUTE(app, "/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });

  CROW_ROUTE(app, "/owners/<string>/documents")
  ([this](const crow::request &req, const std::string &owner_id) {
    return handle_list_documents(req, owner_id);
  });

  CROW_ROUTE(app, "/owners/<string>/documents/<string>")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req,
                                                const std::string &owner_id,
                                                const std::string &document_id) {
        return handle_delete_document(req, owner_id, document_id);
      });

  CROW_ROUTE(app, "/owners/<string>")
      .methods(crow::HTTPMethod::DELETE)(
          [this](const crow::request &req, const std::string &owner_id) {
            return handle_delete_owner(req, owner_id);
          });

  CROW_ROUTE(app, "/owners/<string>/repair")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req, const std::string &owner_id) {
            return handle_repair(req, owner_id);
          });

  std::cout << "All routes registered successfully" << std::endl;
}

nlohmann::json Routes::job_status_to_json(const recall_core::JobStatusView &view) {
  const auto &job = view.job;
  nlohmann::json job_json;
  job_json["id"] = job.id;
  job_json["job_type"] = job.job_type;
  job_json["owner_id"] = job.owner_id;
  job_json["document_id"] = job.document_id;
  job_json["status"] = recall_core::to_string(job.status);
  job_json["retryable"] = job.retryable;
  job_json["cancel_requested"] = job.cancel_requested;
  job_json["error_message"] =
      job.error_message ? nlohmann::json(*job.error_message) : nlohmann::json(nullptr);
  job_json["summary"] = job.summary ? nlohmann::json::parse(*job.summary, nullptr, false)
                                    : nlohmann::json(nullptr);
  job_json["created_at"] = recall_core::JobRepo::time_point_to_string(job.created_at);
  job_json["updated_at"] = recall_core::JobRepo::time_point_to_string(job.updated_at);

  if (view.progress) {
    const auto &progress = *view.progress;
    job_json["progress"] = {{"percent", progress.progress_percent},
                            {"message", progress.status_message},
                            {"total_pages", progress.total_pages},
                            {"processed_pages", progress.processed_pages},
                            {"total_chunks", progress.total_chunks},
                            {"stored_chunks", progress.stored_chunks},
                            {"updated_at", progress.updated_at}};
  } else {
    job_json["progress"] = nullptr;
  }
  return job_json;
}

nlohmann::json Routes::search_response_to_json(const recall_core::SearchResponse &response) {
  nlohmann::json results = nlohmann::json::array();
  for (const auto &group : response.results) {
    nlohmann::json source;
    source["displayName"] = group.display_name;
    source["url"] = group.url ? nlohmann::json(*group.url) : nlohmann::json(nullptr);

    nlohmann::json result_json;
    result_json["text"] = group.text;
    result_json["source"] = source;
    result_json["score"] = group.score;
    result_json["chunkCount"] = group.chunk_count;
    result_json["chunkIds"] = group.chunk_ids;
    results.push_back(result_json);
  }

  nlohmann::json body;
  body["results"] = results;
  body["always_shown"] = response.always_shown;
  body["total"] = response.total;
  return body;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("Recall API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  return create_json_response(response);
}

crow::response Routes::handle_submit_document(const crow::request &req) {
  try {
    recall_core::IngestionRequest request =
        recall_core::ingestion_request_from_json(parse_json_body(req.body));
    std::cout << "Ingestion requested for document '" << request.document_id << "' of owner '"
              << request.owner_id << "'" << std::endl;
    long long job_id = ingestion_service_->submit(request);

    nlohmann::json response = create_success_response("Ingestion queued successfully");
    response["job_id"] = job_id;
    return create_json_response(response, 202);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(std::string("Malformed request: ") + e.what()),
                                400);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const recall_core::IngestionError &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_submit_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_get_job(const crow::request &req, const std::string &job_id) {
  try {
    long long id = std::stoll(job_id);
    auto view = ingestion_service_->get_status(id);
    if (!view) {
      return create_json_response(create_error_response("Job not found"), 404);
    }
    nlohmann::json response = create_success_response("Job status retrieved successfully");
    response["data"] = job_status_to_json(*view);
    return create_json_response(response);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response("Invalid job ID format"), 400);
  } catch (const std::out_of_range &e) {
    return create_json_response(create_error_response("Invalid job ID format"), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_get_job: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_cancel_job(const crow::request &req, const std::string &job_id) {
  try {
    long long id = std::stoll(job_id);
    if (!ingestion_service_->get_status(id)) {
      return create_json_response(create_error_response("Job not found"), 404);
    }
    if (!ingestion_service_->cancel(id)) {
      return create_json_response(create_error_response("Job already finished"), 409);
    }
    std::cout << "Cancellation requested for job " << id << std::endl;
    return create_json_response(create_success_response("Cancellation requested"));
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response("Invalid job ID format"), 400);
  } catch (const std::out_of_range &e) {
    return create_json_response(create_error_response("Invalid job ID format"), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_cancel_job: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_search(const crow::request &req) {
  try {
    auto json_body = parse_json_body(req.body);
    std::string owner_id = json_body.value("owner_id", "");
    std::string query = json_body.value("query", "");
    if (owner_id.empty()) {
      return create_json_response(create_error_response("owner_id is required"), 400);
    }
    std::optional<int> top_k;
    if (json_body.contains("top_k")) {
      top_k = json_body.at("top_k").get<int>();
    }
    bool highlight = json_body.value("highlight", false);

    std::cout << "Search for owner '" << owner_id << "': " << query << std::endl;
    recall_core::SearchResponse results =
        search_service_->search(owner_id, query, top_k, highlight);
    std::cout << "Source groups: " << results.total << std::endl;
    return create_json_response(search_response_to_json(results));
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(std::string("Malformed request: ") + e.what()),
                                400);
  } catch (const recall_core::SearchServiceException &e) {
    std::cerr << "Exception in handle_search: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 503);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_search: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_list_documents(const crow::request &req,
                                             const std::string &owner_id) {
  try {
    nlohmann::json documents = nlohmann::json::array();
    for (const auto &doc : document_service_->list_documents(owner_id)) {
      nlohmann::json doc_json;
      doc_json["document_id"] = doc.document_id;
      doc_json["source_title"] = doc.source_title;
      doc_json["source_type"] = recall_core::to_string(doc.source_type);
      doc_json["chunk_count"] = doc.chunk_count;
      doc_json["updated_at"] = doc.updated_at;
      documents.push_back(doc_json);
    }
    nlohmann::json response = create_success_response("Documents retrieved successfully");
    response["data"]["documents"] = documents;
    response["data"]["count"] = documents.size();
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_list_documents: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_delete_document(const crow::request &req,
                                              const std::string &owner_id,
                                              const std::string &document_id) {
  try {
    int removed = document_service_->delete_document(owner_id, document_id);
    if (removed == 0) {
      return create_json_response(create_error_response("Document not found"), 404);
    }
    nlohmann::json response = create_success_response("Document deleted successfully");
    response["deleted_chunks"] = removed;
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_delete_document: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_delete_owner(const crow::request &req, const std::string &owner_id) {
  try {
    int removed = document_service_->delete_owner(owner_id);
    nlohmann::json response = create_success_response("Owner data deleted successfully");
    response["deleted_chunks"] = removed;
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_delete_owner: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_repair(const crow::request &req, const std::string &owner_id) {
  try {
    recall_core::RepairStats stats = repair_service_->repair(owner_id, repair_batch_size_);
    nlohmann::json response = create_success_response("Embedding repair finished");
    response["repaired"] = stats.repaired;
    response["remaining"] = stats.remaining;
    return create_json_response(response);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_repair: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

}  // namespace recall_api
