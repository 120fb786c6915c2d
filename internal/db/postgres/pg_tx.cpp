#include "pg_tx.hpp"

namespace dispatcher::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

// pqxx::work aborts an open transaction on destruction, and tx_ is
// destroyed before conn_ returns to the pool.
PgTransaction::~PgTransaction() = default;

Result PgTransaction::Commit() {
  try {
    tx_->commit();
    finished_ = true;
    return Result::Ok();
  } catch (const pqxx::serialization_failure& e) {
    finished_ = true;
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  } catch (const pqxx::deadlock_detected& e) {
    finished_ = true;
    return Result::Err(ErrorCode::Busy, e.what());
  } catch (const pqxx::broken_connection& e) {
    finished_ = true;
    return Result::Err(ErrorCode::IOError, e.what());
  } catch (const pqxx::in_doubt_error& e) {
    finished_ = true;
    return Result::Err(ErrorCode::InternalError, e.what());
  } catch (const pqxx::sql_error& e) {
    finished_ = true;
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

void PgTransaction::Rollback() {
  tx_->abort();
  finished_ = true;
}

} // namespace dispatcher::db::postgres
