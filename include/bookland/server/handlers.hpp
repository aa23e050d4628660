#pragma once

#include <bookland/catalog.hpp>
#include <bookland/convert.hpp>
#include <bookland/server/metrics.hpp>

#include <drogon/HttpAppFramework.h>
#include <json/json.h>

#include <memory>
#include <string>
#include <string_view>

namespace bookland::server {

/** HTTP status for a dispatcher error code (200 for kOk). */
int HttpStatusFor(ErrorCode code);

/**
 * JSON body for a dispatcher result:
 * {input, kind, outcome, route, checksum_valid, isbn13?, message?}
 */
Json::Value ConversionToJson(std::string_view input, const ConversionResult& result);

/**
 * JSON body for a check-digit verification of a 10- or 13-character code:
 * {input, format, valid, expected_check_digit}.
 * @throws LengthError for any other length, FormatError on bad characters.
 */
Json::Value VerifyToJson(std::string_view code);

/** JSON body for a catalog product. */
Json::Value ProductToJson(const ProductRecord& record);

/**
 * Create an error response from a dispatcher error code.
 */
drogon::HttpResponsePtr MakeErrorResponse(ErrorCode code, const std::string& message);

/**
 * Create an error response from a RocksDB status.
 */
drogon::HttpResponsePtr MakeErrorResponse(const rocksdb::Status& status,
                                          const std::string& context);

/**
 * Register the conversion, catalog and health handlers with the Drogon app.
 * catalog may be null; catalog routes then answer 503. metrics and tracer
 * are optional.
 */
void RegisterHandlers(std::shared_ptr<UpcCatalog> catalog,
                      std::shared_ptr<PrometheusMetrics> metrics,
                      std::shared_ptr<Tracer> tracer);

}  // namespace bookland::server
