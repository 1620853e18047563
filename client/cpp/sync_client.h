#pragma once

#include <google/protobuf/struct.pb.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "client/cpp/http_client.h"
#include "client/cpp/outcome.h"
#include "gearledger/sync/v1.hpp"

namespace gearledger::sync::client {

struct CatalogFile {
  std::string filename;
  std::string bytes;
};

/*
  SyncClient

  Blocking REST client for one sync server. Thread-compatible: every call
  opens its own connection, so one instance may be shared across threads.
*/
class SyncClient {
 public:
  // `server_url` is `http://host:port`. An unparsable URL makes every call
  // fail with an error outcome.
  explicit SyncClient(const std::string& server_url, std::chrono::milliseconds timeout = std::chrono::seconds(5));

  const std::string& ServerUrl() const {
    return server_url_;
  }

  // Status request followed by a best-effort version request, which registers
  // this host as a connected client.
  Outcome<v1::StatusResponse> CheckConnection() const;

  Outcome<v1::StatusResponse> GetStatus() const;

  // -1 when the server cannot be reached.
  int32_t GetSyncVersion() const;

  Outcome<v1::ListResultsResponse> GetResults(const std::optional<std::string>& client = std::nullopt) const;

  Outcome<v1::UpsertResultResponse> AddResult(const v1::UpsertResultRequest& request) const;

  Outcome<v1::GetResultResponse> GetResult(int64_t id) const;

  Outcome<v1::AckResponse> UpdateResult(int64_t id, const google::protobuf::Struct& fields) const;

  Outcome<v1::AckResponse> DeleteResult(int64_t id) const;

  Outcome<v1::ClearResultsResponse> ClearResults(const std::optional<std::string>& client = std::nullopt) const;

  Outcome<v1::ListClientsResponse> GetClients() const;

  Outcome<v1::ClientCountResponse> GetConnectedClientCount() const;

  Outcome<v1::CatalogInfoResponse> GetCatalogInfo() const;

  Outcome<CatalogFile> DownloadCatalog() const;

  // Quotes, backslashes and line breaks in `filename` are replaced with '_'
  // before it goes into the multipart header.
  Outcome<v1::CatalogUploadResponse> UploadCatalog(const std::string& filename, const std::string& bytes) const;

 private:
  // One request on a fresh connection, decoded as `Response`.
  template <typename Response, typename Send>
  Outcome<Response> Call(const std::string& target, Send send) const;

  std::string                  server_url_;
  std::optional<ServerAddress> address_;
  std::chrono::milliseconds    timeout_;
};

} // namespace gearledger::sync::client
