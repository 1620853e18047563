#include "result_ledger.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/artikul.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace gearledger::ledger {

namespace {

void ThrowIfError(const db::Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  switch (result.code) {
    case db::ErrorCode::kNotFound:
      throw util::NotFound("Not found");
    case db::ErrorCode::kDuplicateKey:
      throw util::AlreadyExists(prefix + ": " + result.message);
    case db::ErrorCode::kBusy:
      throw util::Unavailable(prefix + ": " + result.message);
    default:
      throw std::runtime_error(prefix + ": " + result.message);
  }
}

std::optional<std::string> ClientKey(const std::optional<std::string>& client) {
  if (!client || client->empty()) {
    return std::nullopt;
  }
  return util::ToUpper(*client);
}

} // namespace

ResultLedger::ResultLedger(std::shared_ptr<db::ResultsRepository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("ResultLedger requires a repository");
  }
}

UpsertOutcome ResultLedger::UpsertResult(const ResultWrite& write) {
  if (write.artikul.empty() || write.client.empty()) {
    throw util::InvalidArgument("artikul and client required");
  }
  if (write.quantity < 0) {
    throw util::InvalidArgument("quantity must be >= 0");
  }
  if (write.quantity > kMaxQuantity) {
    throw util::InvalidArgument("quantity must be <= " + std::to_string(kMaxQuantity));
  }

  const auto normalized_key = util::NormalizeArtikul(write.artikul);
  const auto client_key     = util::ToUpper(write.client);
  if (normalized_key.empty()) {
    throw util::InvalidArgument("artikul has no matchable characters");
  }

  const auto now = util::NowIso8601();
  auto       tx  = repository_->Begin(db::TxMode::kWrite);

  UpsertOutcome outcome;
  if (auto existing = repository_->FindByKey(*tx, normalized_key, client_key)) {
    auto& row = *existing;
    if (write.quantity > kMaxQuantity - row.quantity) {
      throw util::InvalidArgument("merged quantity must be <= " + std::to_string(kMaxQuantity));
    }
    row.quantity += write.quantity;
    if (write.sale_price > 0) {
      row.sale_price = write.sale_price;
    }
    row.total_price = row.sale_price * static_cast<double>(row.quantity);
    if (!write.brand.empty()) {
      row.brand = write.brand;
    }
    if (!write.description.empty()) {
      row.description = write.description;
    }
    row.last_updated = now;

    ThrowIfError(repository_->UpdateResult(*tx, row), "UpsertResult update");
    outcome.id = row.id;
  } else {
    db::model::ResultRecord row;
    row.artikul        = write.artikul;
    row.normalized_key = normalized_key;
    row.client         = write.client;
    row.client_key     = client_key;
    row.quantity       = write.quantity;
    row.weight         = write.weight;
    row.brand          = write.brand;
    row.description    = write.description;
    row.sale_price     = write.sale_price;
    row.total_price    = write.sale_price * static_cast<double>(write.quantity);
    row.last_updated   = now;
    row.created_at     = now;

    ThrowIfError(repository_->InsertResult(*tx, row), "UpsertResult insert");
    outcome.id       = row.id;
    outcome.inserted = true;
  }

  tx->Commit();

  GEARLEDGER_LOG_DEBUG("result upserted", {observability::StringField("artikul", write.artikul),
                                           observability::StringField("client", write.client),
                                           observability::StringField("action", outcome.inserted ? "inserted" : "updated"),
                                           observability::IntField("id", outcome.id)});
  return outcome;
}

std::optional<db::model::ResultRecord> ResultLedger::GetResult(int64_t id) {
  auto tx  = repository_->Begin(db::TxMode::kRead);
  auto row = repository_->GetResult(*tx, id);
  tx->Commit();
  return row;
}

std::vector<db::model::ResultRecord> ResultLedger::ListResults(const std::optional<std::string>& client) {
  auto tx   = repository_->Begin(db::TxMode::kRead);
  auto rows = repository_->ListResults(*tx, ClientKey(client));
  tx->Commit();
  return rows;
}

bool ResultLedger::UpdateResult(int64_t id, const db::model::ResultPatch& patch) {
  if (patch.Empty()) {
    return false;
  }
  if (patch.artikul && util::NormalizeArtikul(*patch.artikul).empty()) {
    throw util::InvalidArgument("artikul has no matchable characters");
  }
  if (patch.client && patch.client->empty()) {
    throw util::InvalidArgument("client must not be empty");
  }
  if (patch.quantity && *patch.quantity < 0) {
    throw util::InvalidArgument("quantity must be >= 0");
  }
  if (patch.quantity && *patch.quantity > kMaxQuantity) {
    throw util::InvalidArgument("quantity must be <= " + std::to_string(kMaxQuantity));
  }

  auto tx = repository_->Begin(db::TxMode::kWrite);
  ThrowIfError(repository_->PatchResult(*tx, id, patch, util::NowIso8601()), "UpdateResult " + std::to_string(id));
  tx->Commit();
  return true;
}

void ResultLedger::DeleteResult(int64_t id) {
  auto tx = repository_->Begin(db::TxMode::kWrite);
  ThrowIfError(repository_->DeleteResult(*tx, id), "DeleteResult " + std::to_string(id));
  tx->Commit();
}

int64_t ResultLedger::ClearResults(const std::optional<std::string>& client) {
  int64_t deleted = 0;
  auto    tx      = repository_->Begin(db::TxMode::kWrite);
  ThrowIfError(repository_->ClearResults(*tx, ClientKey(client), &deleted), "ClearResults");
  tx->Commit();
  return deleted;
}

std::vector<std::string> ResultLedger::ListClients() {
  auto tx      = repository_->Begin(db::TxMode::kRead);
  auto clients = repository_->ListClients(*tx);
  tx->Commit();
  return clients;
}

std::map<std::string, std::vector<db::model::ResultRecord>> ResultLedger::ExportByClient() {
  std::map<std::string, std::vector<db::model::ResultRecord>> by_client;
  for (auto& row : ListResults()) {
    by_client[row.client].push_back(std::move(row));
  }
  return by_client;
}

} // namespace gearledger::ledger
