#include "client/cpp/sync_client.h"

#include <httplib.h>

#include "internal/observability/logging.hpp"
#include "internal/util/json.hpp"

namespace gearledger::sync::client {

namespace {

constexpr const char* kJson = "application/json";

std::string ErrorFromReply(const httplib::Response& reply) {
  v1::ErrorResponse error;
  if (gearledger::util::TryFromJson(reply.body, &error) && !error.error().empty()) {
    return error.error();
  }
  return "HTTP " + std::to_string(reply.status);
}

// filename="..." from a Content-Disposition value.
std::string AttachmentFilename(const std::string& disposition) {
  const std::string key = "filename=";
  const auto        pos = disposition.find(key);
  if (pos == std::string::npos) {
    return {};
  }
  auto value = disposition.substr(pos + key.size());
  if (!value.empty() && value.front() == '"') {
    const auto end = value.find('"', 1);
    return value.substr(1, end == std::string::npos ? std::string::npos : end - 1);
  }
  return value.substr(0, value.find(';'));
}

// Sends one request on a fresh connection; non-2xx replies become failures
// carrying the server's error message.
template <typename Send>
Outcome<httplib::Response> Exchange(const std::optional<ServerAddress>& address, const std::string& server_url,
                                    std::chrono::milliseconds timeout, const std::string& target, Send send) {
  if (!address) {
    return Outcome<httplib::Response>::Failure("invalid server URL: " + server_url);
  }

  auto http   = MakeHttpClient(*address, timeout, timeout);
  auto result = send(*http);
  if (!result) {
    const auto error = httplib::to_string(result.error());
    GEARLEDGER_LOG_DEBUG("Sync request failed", {observability::StringField("target", target), observability::StringField("error", error)});
    return Outcome<httplib::Response>::Failure(error);
  }
  if (result->status < 200 || result->status >= 300) {
    return Outcome<httplib::Response>::Failure(ErrorFromReply(*result));
  }
  return Outcome<httplib::Response>::Success(*result);
}

template <typename Response>
Outcome<Response> Decode(Outcome<httplib::Response> reply, const std::string& target) {
  if (!reply.ok) {
    return Outcome<Response>::Failure(std::move(reply.error));
  }
  Response response;
  if (!gearledger::util::TryFromJson(reply.value.body, &response)) {
    return Outcome<Response>::Failure("malformed response from " + target);
  }
  return Outcome<Response>::Success(std::move(response));
}

httplib::Params ClientParams(const std::optional<std::string>& client) {
  httplib::Params params;
  if (client && !client->empty()) {
    params.emplace("client", *client);
  }
  return params;
}

} // namespace

SyncClient::SyncClient(const std::string& server_url, std::chrono::milliseconds timeout)
    : server_url_(server_url), address_(ParseServerUrl(server_url)), timeout_(timeout) {
}

template <typename Response, typename Send>
Outcome<Response> SyncClient::Call(const std::string& target, Send send) const {
  return Decode<Response>(Exchange(address_, server_url_, timeout_, target, std::move(send)), target);
}

Outcome<v1::StatusResponse> SyncClient::CheckConnection() const {
  auto status = GetStatus();
  if (status.ok) {
    GetSyncVersion();
  }
  return status;
}

Outcome<v1::StatusResponse> SyncClient::GetStatus() const {
  const std::string target = "/api/status";
  return Call<v1::StatusResponse>(target, [&](httplib::Client& http) { return http.Get(target); });
}

int32_t SyncClient::GetSyncVersion() const {
  const std::string target  = "/api/sync/version";
  const auto        outcome = Call<v1::SyncVersionResponse>(target, [&](httplib::Client& http) { return http.Get(target); });
  if (!outcome.ok || !outcome.value.ok()) {
    return -1;
  }
  return outcome.value.version();
}

Outcome<v1::ListResultsResponse> SyncClient::GetResults(const std::optional<std::string>& client) const {
  const std::string target = "/api/results";
  const auto        params = ClientParams(client);
  return Call<v1::ListResultsResponse>(target, [&](httplib::Client& http) { return http.Get(target, params, httplib::Headers{}); });
}

Outcome<v1::UpsertResultResponse> SyncClient::AddResult(const v1::UpsertResultRequest& request) const {
  v1::UpsertResultRequest body = request;
  if (!body.has_quantity()) {
    body.set_quantity(1);
  }
  const std::string target = "/api/results";
  const auto        json   = gearledger::util::ToJson(body);
  return Call<v1::UpsertResultResponse>(target, [&](httplib::Client& http) { return http.Post(target, json, kJson); });
}

Outcome<v1::GetResultResponse> SyncClient::GetResult(int64_t id) const {
  const std::string target = "/api/results/" + std::to_string(id);
  return Call<v1::GetResultResponse>(target, [&](httplib::Client& http) { return http.Get(target); });
}

Outcome<v1::AckResponse> SyncClient::UpdateResult(int64_t id, const google::protobuf::Struct& fields) const {
  const std::string target = "/api/results/" + std::to_string(id);
  const auto        json   = gearledger::util::ToJson(fields);
  return Call<v1::AckResponse>(target, [&](httplib::Client& http) { return http.Put(target, json, kJson); });
}

Outcome<v1::AckResponse> SyncClient::DeleteResult(int64_t id) const {
  const std::string target = "/api/results/" + std::to_string(id);
  return Call<v1::AckResponse>(target, [&](httplib::Client& http) { return http.Delete(target); });
}

Outcome<v1::ClearResultsResponse> SyncClient::ClearResults(const std::optional<std::string>& client) const {
  v1::ClearResultsRequest request;
  if (client) {
    request.set_client(*client);
  }
  const std::string target = "/api/results/clear";
  const auto        json   = gearledger::util::ToJson(request);
  return Call<v1::ClearResultsResponse>(target, [&](httplib::Client& http) { return http.Post(target, json, kJson); });
}

Outcome<v1::ListClientsResponse> SyncClient::GetClients() const {
  const std::string target = "/api/clients";
  return Call<v1::ListClientsResponse>(target, [&](httplib::Client& http) { return http.Get(target); });
}

Outcome<v1::ClientCountResponse> SyncClient::GetConnectedClientCount() const {
  const std::string target = "/api/clients/count";
  return Call<v1::ClientCountResponse>(target, [&](httplib::Client& http) { return http.Get(target); });
}

Outcome<v1::CatalogInfoResponse> SyncClient::GetCatalogInfo() const {
  const std::string target = "/api/catalog/info";
  return Call<v1::CatalogInfoResponse>(target, [&](httplib::Client& http) { return http.Get(target); });
}

Outcome<CatalogFile> SyncClient::DownloadCatalog() const {
  const std::string target = "/api/catalog";
  auto reply = Exchange(address_, server_url_, timeout_, target, [&](httplib::Client& http) { return http.Get(target); });
  if (!reply.ok) {
    return Outcome<CatalogFile>::Failure(std::move(reply.error));
  }

  CatalogFile file;
  file.filename = AttachmentFilename(reply.value.get_header_value("Content-Disposition"));
  file.bytes    = std::move(reply.value.body);
  return Outcome<CatalogFile>::Success(std::move(file));
}

Outcome<v1::CatalogUploadResponse> SyncClient::UploadCatalog(const std::string& filename, const std::string& bytes) const {
  std::string safe = filename;
  for (auto& c : safe) {
    if (c == '"' || c == '\\' || c == '\r' || c == '\n') {
      c = '_';
    }
  }

  const std::string                   target = "/api/catalog";
  const httplib::MultipartFormDataItems items  = {{"file", bytes, safe, "application/octet-stream"}};
  return Call<v1::CatalogUploadResponse>(target, [&](httplib::Client& http) { return http.Post(target, items); });
}

} // namespace gearledger::sync::client
