#include "recall_core/db/job_repo.hpp"

#include <sqlite_modern_cpp.h>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "recall_core/db/pooled_connection.hpp"
#include "recall_core/db/sqlite_error_utils.hpp"
#include "recall_core/db/transaction.hpp"

namespace recall_core {

namespace {

constexpr const char* kJobColumns =
    "id, job_type, owner_id, document_id, status, priority, payload, summary, error_message, "
    "retryable, cancel_requested, created_at, updated_at";

auto job_row_reader(std::vector<JobDTO>& out) {
  return [&out](long long id, std::string job_type, std::string owner_id, std::string document_id,
                std::string status, int priority, std::string payload,
                std::optional<std::string> summary, std::optional<std::string> error_message,
                int retryable, int cancel_requested, std::string created_at,
                std::string updated_at) {
    JobDTO job;
    job.id = id;
    job.job_type = std::move(job_type);
    job.owner_id = std::move(owner_id);
    job.document_id = std::move(document_id);
    job.status = job_status_from_string(status);
    job.priority = priority;
    job.payload = std::move(payload);
    job.summary = std::move(summary);
    job.error_message = std::move(error_message);
    job.retryable = retryable != 0;
    job.cancel_requested = cancel_requested != 0;
    job.created_at = JobRepo::string_to_time_point(created_at);
    job.updated_at = JobRepo::string_to_time_point(updated_at);
    out.push_back(std::move(job));
  };
}

}  // namespace

JobRepo::JobRepo(DatabaseManager& db_manager) : db_manager_(db_manager) {}

std::string JobRepo::time_point_to_string(const std::chrono::system_clock::time_point& tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_struct = {};
  gmtime_r(&time_t, &tm_struct);
  std::stringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

std::chrono::system_clock::time_point JobRepo::string_to_time_point(const std::string& time_str) {
  std::tm tm_struct = {};
  std::stringstream ss(time_str);
  ss >> std::get_time(&tm_struct, "%Y-%m-%d %H:%M:%S");
  return std::chrono::system_clock::from_time_t(timegm(&tm_struct));
}

long long JobRepo::create_job(const std::string& job_type,
                              const std::string& owner_id,
                              const std::string& document_id,
                              const std::string& payload,
                              int priority) {
  try {
    PooledConnection conn(db_manager_);
    std::string now = time_point_to_string(std::chrono::system_clock::now());
    *conn << "INSERT INTO ingestion_jobs (job_type, owner_id, document_id, payload, priority, "
             "created_at, updated_at) VALUES (?,?,?,?,?,?,?)"
          << job_type << owner_id << document_id << payload << priority << now << now;
    return static_cast<long long>(conn->last_insert_rowid());
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("create_job", e));
  }
}

std::optional<JobDTO> JobRepo::fetch_and_claim_next_job() {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    std::vector<JobDTO> rows;
    *conn << std::string("SELECT ") + kJobColumns +
                 " FROM ingestion_jobs WHERE status = ? "
                 "ORDER BY priority ASC, created_at ASC, id ASC LIMIT 1"
          << to_string(JobStatus::PENDING) >>
        job_row_reader(rows);

    if (rows.empty()) {
      tx.commit();
      return std::nullopt;
    }

    JobDTO job = std::move(rows.front());
    auto now = std::chrono::system_clock::now();
    *conn << "UPDATE ingestion_jobs SET status = ?, updated_at = ? WHERE id = ?"
          << to_string(JobStatus::PROCESSING) << time_point_to_string(now) << job.id;
    tx.commit();
    job.status = JobStatus::PROCESSING;
    job.updated_at = now;
    return job;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("fetch_and_claim_next_job", e));
  }
}

std::optional<JobDTO> JobRepo::get_job(long long job_id) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<JobDTO> rows;
    *conn << std::string("SELECT ") + kJobColumns + " FROM ingestion_jobs WHERE id = ?"
          << job_id >>
        job_row_reader(rows);
    if (rows.empty()) {
      return std::nullopt;
    }
    return std::move(rows.front());
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("get_job", e));
  }
}

std::vector<JobDTO> JobRepo::get_jobs_by_status(JobStatus status) {
  try {
    PooledConnection conn(db_manager_);
    std::vector<JobDTO> rows;
    *conn << std::string("SELECT ") + kJobColumns +
                 " FROM ingestion_jobs WHERE status = ? ORDER BY priority ASC, created_at ASC, "
                 "id ASC"
          << to_string(status) >>
        job_row_reader(rows);
    return rows;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("get_jobs_by_status", e));
  }
}

void JobRepo::update_job_status(long long job_id, JobStatus new_status) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE ingestion_jobs SET status = ?, updated_at = ? WHERE id = ?"
          << to_string(new_status) << time_point_to_string(std::chrono::system_clock::now())
          << job_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("update_job_status", e));
  }
}

void JobRepo::mark_job_completed(long long job_id, const std::string& summary) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE ingestion_jobs SET status = ?, summary = ?, updated_at = ? WHERE id = ?"
          << to_string(JobStatus::COMPLETED) << summary
          << time_point_to_string(std::chrono::system_clock::now()) << job_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("mark_job_completed", e));
  }
}

void JobRepo::mark_job_failed(long long job_id,
                              const std::string& error_message,
                              bool retryable,
                              const std::optional<std::string>& summary) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE ingestion_jobs SET status = ?, error_message = ?, retryable = ?, "
             "summary = COALESCE(?, summary), updated_at = ? WHERE id = ?"
          << to_string(JobStatus::FAILED) << error_message << (retryable ? 1 : 0) << summary
          << time_point_to_string(std::chrono::system_clock::now()) << job_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("mark_job_failed", e));
  }
}

void JobRepo::mark_job_cancelled(long long job_id, const std::optional<std::string>& summary) {
  try {
    PooledConnection conn(db_manager_);
    *conn << "UPDATE ingestion_jobs SET status = ?, summary = COALESCE(?, summary), "
             "updated_at = ? WHERE id = ?"
          << to_string(JobStatus::CANCELLED) << summary
          << time_point_to_string(std::chrono::system_clock::now()) << job_id;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("mark_job_cancelled", e));
  }
}

bool JobRepo::request_cancel(long long job_id) {
  try {
    PooledConnection conn(db_manager_);
    Transaction tx(*conn, true);
    std::optional<std::string> status;
    *conn << "SELECT status FROM ingestion_jobs WHERE id = ?" << job_id >>
        [&](std::string s) { status = std::move(s); };
    if (!status || is_terminal(job_status_from_string(*status))) {
      return false;
    }

    std::string now = time_point_to_string(std::chrono::system_clock::now());
    if (job_status_from_string(*status) == JobStatus::PENDING) {
      *conn << "UPDATE ingestion_jobs SET status = ?, cancel_requested = 1, updated_at = ? "
               "WHERE id = ?"
            << to_string(JobStatus::CANCELLED) << now << job_id;
    } else {
      *conn << "UPDATE ingestion_jobs SET cancel_requested = 1, updated_at = ? WHERE id = ?"
            << now << job_id;
    }
    tx.commit();
    return true;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("request_cancel", e));
  }
}

bool JobRepo::is_cancel_requested(long long job_id) {
  try {
    PooledConnection conn(db_manager_);
    int flag = 0;
    *conn << "SELECT cancel_requested FROM ingestion_jobs WHERE id = ?" << job_id >>
        [&](int value) { flag = value; };
    return flag != 0;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("is_cancel_requested", e));
  }
}

void JobRepo::upsert_job_progress(long long job_id,
                                  float percent,
                                  const std::string& message,
                                  const JobCounters& counters) {
  try {
    PooledConnection conn(db_manager_);
    *conn << R"(
        INSERT INTO job_progress (job_id, progress_percent, status_message, total_pages,
                                  processed_pages, total_chunks, stored_chunks, updated_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(job_id) DO UPDATE SET
            progress_percent = excluded.progress_percent,
            status_message = excluded.status_message,
            total_pages = excluded.total_pages,
            processed_pages = excluded.processed_pages,
            total_chunks = excluded.total_chunks,
            stored_chunks = excluded.stored_chunks,
            updated_at = excluded.updated_at
      )" << job_id
          << percent << message << counters.total_pages << counters.processed_pages
          << counters.total_chunks << counters.stored_chunks
          << time_point_to_string(std::chrono::system_clock::now());
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("upsert_job_progress", e));
  }
}

std::optional<JobProgressDTO> JobRepo::get_job_progress(long long job_id) {
  try {
    PooledConnection conn(db_manager_);
    std::optional<JobProgressDTO> result;
    *conn << "SELECT job_id, progress_percent, status_message, total_pages, processed_pages, "
             "total_chunks, stored_chunks, updated_at FROM job_progress WHERE job_id = ?"
          << job_id >>
        [&](long long id, double percent, std::string message, int total_pages,
            int processed_pages, int total_chunks, int stored_chunks, std::string updated_at) {
          JobProgressDTO progress;
          progress.job_id = id;
          progress.progress_percent = static_cast<float>(percent);
          progress.status_message = std::move(message);
          progress.total_pages = total_pages;
          progress.processed_pages = processed_pages;
          progress.total_chunks = total_chunks;
          progress.stored_chunks = stored_chunks;
          progress.updated_at = std::move(updated_at);
          result = std::move(progress);
        };
    return result;
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("get_job_progress", e));
  }
}

int JobRepo::clear_finished_jobs(int older_than_days) {
  try {
    PooledConnection conn(db_manager_);
    auto cutoff = std::chrono::system_clock::now() - std::chrono::hours(24 * older_than_days);
    *conn << "DELETE FROM ingestion_jobs WHERE status IN (?, ?, ?) AND updated_at <= ?"
          << to_string(JobStatus::COMPLETED) << to_string(JobStatus::FAILED)
          << to_string(JobStatus::CANCELLED) << time_point_to_string(cutoff);
    return conn->rows_modified();
  } catch (const sqlite::sqlite_exception& e) {
    throw JobRepoError(format_db_error("clear_finished_jobs", e));
  }
}

}  // namespace recall_core
