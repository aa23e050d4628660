#include <bookland/server/handlers.hpp>

#include <bookland/checksum.hpp>

#include <drogon/drogon.h>

#include <sstream>

namespace bookland::server {

namespace {

using Callback = std::function<void(const drogon::HttpResponsePtr&)>;

void Send(RequestTimer& timer, const Callback& callback,
          const drogon::HttpResponsePtr& resp) {
  timer.SetStatusCode(static_cast<int>(resp->statusCode()));
  callback(resp);
}

drogon::HttpResponsePtr JsonResponse(const Json::Value& json, int http_code) {
  auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
  resp->setStatusCode(static_cast<drogon::HttpStatusCode>(http_code));
  return resp;
}

drogon::HttpResponsePtr NoCatalogResponse() {
  Json::Value json;
  json["error"] = "catalog_unavailable";
  json["message"] = "no UPC catalog configured";
  json["code"] = 503;
  return JsonResponse(json, 503);
}

drogon::HttpResponsePtr BadRequest(const std::string& message) {
  Json::Value json;
  json["error"] = "invalid_argument";
  json["message"] = message;
  json["code"] = 400;
  return JsonResponse(json, 400);
}

// Drogon only parses the body when Content-Type says JSON; fall back to a
// manual parse so clients that omit the header still work.
std::shared_ptr<Json::Value> ParseJsonBody(const drogon::HttpRequestPtr& req) {
  auto json = req->getJsonObject();
  if (json) return json;

  Json::Value parsed;
  Json::CharReaderBuilder builder;
  std::string errors;
  std::istringstream stream{std::string(req->body())};
  if (Json::parseFromStream(builder, stream, &parsed, &errors)) {
    return std::make_shared<Json::Value>(parsed);
  }
  return nullptr;
}

}  // namespace

// --- Response Helpers ---

int HttpStatusFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk: return 200;
    case ErrorCode::kLength:
    case ErrorCode::kFormat: return 400;
    case ErrorCode::kNotFound: return 404;
    case ErrorCode::kAmbiguous: return 409;
    case ErrorCode::kUnsupported:
    case ErrorCode::kUnknownLength: return 422;
    case ErrorCode::kResolver: return 502;
  }
  return 500;
}

Json::Value ConversionToJson(std::string_view input, const ConversionResult& result) {
  Json::Value json;
  json["input"] = std::string(input);
  switch (result.kind()) {
    case ConversionKind::kConverted: json["kind"] = "converted"; break;
    case ConversionKind::kUnsupported: json["kind"] = "unsupported"; break;
    case ConversionKind::kFailed: json["kind"] = "failed"; break;
  }
  json["outcome"] = std::string(ErrorCodeName(result.error()));
  json["route"] = std::string(ConversionRouteName(result.route()));
  json["checksum_valid"] = result.checksum_valid();
  if (result.has_value()) {
    json["isbn13"] = result.isbn13();
  }
  if (!result.message().empty()) {
    json["message"] = result.message();
  }
  return json;
}

Json::Value VerifyToJson(std::string_view code) {
  Json::Value json;
  json["input"] = std::string(code);
  if (code.size() == 10) {
    json["format"] = "isbn10";
    json["valid"] = Isbn10Verify(code);
    json["expected_check_digit"] = std::string(1, Isbn10Checksum(code.substr(0, 9)));
  } else if (code.size() == 13) {
    json["format"] = "isbn13";
    json["valid"] = Isbn13Verify(code);
    json["expected_check_digit"] = std::string(1, Isbn13Checksum(code.substr(0, 12)));
  } else {
    throw LengthError("need 10 or 13 digits - got " + std::to_string(code.size()));
  }
  return json;
}

Json::Value ProductToJson(const ProductRecord& record) {
  Json::Value json;
  json["product_id"] = record.product_id;
  json["isbn13"] = record.isbn_number;
  json["superseded"] = record.superseded;
  return json;
}

drogon::HttpResponsePtr MakeErrorResponse(ErrorCode code, const std::string& message) {
  int http_code = HttpStatusFor(code);
  Json::Value json;
  json["error"] = std::string(ErrorCodeName(code));
  json["message"] = message;
  json["code"] = http_code;
  return JsonResponse(json, http_code);
}

drogon::HttpResponsePtr MakeErrorResponse(const rocksdb::Status& status,
                                          const std::string& context) {
  Json::Value json;
  int http_code = 500;

  if (status.IsNotFound()) {
    json["error"] = "not_found";
    http_code = 404;
  } else if (status.IsInvalidArgument()) {
    json["error"] = "invalid_argument";
    http_code = 400;
  } else if (status.IsBusy() || status.IsTryAgain()) {
    json["error"] = "service_busy";
    http_code = 503;
  } else {
    json["error"] = "internal_error";
  }

  json["code"] = http_code;
  json["message"] = context + ": " + status.ToString();
  return JsonResponse(json, http_code);
}

// --- Handler Registration ---

void RegisterHandlers(std::shared_ptr<UpcCatalog> catalog,
                      std::shared_ptr<PrometheusMetrics> metrics,
                      std::shared_ptr<Tracer> tracer) {
  auto& app = drogon::app();

  ConvertOptions convert_opt;
  convert_opt.resolver = catalog;
  convert_opt.metrics = metrics;
  convert_opt.tracer = tracer;

  // ==========================================================================
  // Conversion Endpoints
  // ==========================================================================

  // GET /api/v1/isbn/{code} - Normalize any supported encoding to ISBN-13
  app.registerHandler(
      "/api/v1/isbn/{code}",
      [convert_opt, metrics](const drogon::HttpRequestPtr& req, Callback&& callback,
                             const std::string& code) {
        (void)req;
        RequestTimer timer(metrics, "GET", "/api/v1/isbn/{code}");
        ConversionResult result = ConvertTo13(code, convert_opt);
        Send(timer, callback,
             JsonResponse(ConversionToJson(code, result), HttpStatusFor(result.error())));
      },
      {drogon::Get});

  // GET /api/v1/isbn/{code}/verify - Check digit verification
  app.registerHandler(
      "/api/v1/isbn/{code}/verify",
      [metrics](const drogon::HttpRequestPtr& req, Callback&& callback,
                const std::string& code) {
        (void)req;
        RequestTimer timer(metrics, "GET", "/api/v1/isbn/{code}/verify");
        try {
          Send(timer, callback, JsonResponse(VerifyToJson(code), 200));
        } catch (const Error& e) {
          Send(timer, callback, MakeErrorResponse(e.code(), e.what()));
        }
      },
      {drogon::Get});

  // GET /api/v1/scanned/{code} - Best-effort slices of a raw scan
  app.registerHandler(
      "/api/v1/scanned/{code}",
      [metrics](const drogon::HttpRequestPtr& req, Callback&& callback,
                const std::string& code) {
        (void)req;
        RequestTimer timer(metrics, "GET", "/api/v1/scanned/{code}");
        Json::Value json;
        json["input"] = code;
        auto isbn10 = ScannedToIsbn10(code);
        auto isbn13 = ScannedToIsbn13(code);
        json["isbn10"] = isbn10 ? Json::Value(*isbn10) : Json::Value(Json::nullValue);
        json["isbn13"] = isbn13 ? Json::Value(*isbn13) : Json::Value(Json::nullValue);
        Send(timer, callback, JsonResponse(json, 200));
      },
      {drogon::Get});

  // ==========================================================================
  // Catalog Endpoints
  // ==========================================================================

  // PUT /api/v1/products/{id} - Create or replace a product
  // Body: {"isbn13": "9781600108853", "superseded": false}
  app.registerHandler(
      "/api/v1/products/{id}",
      [catalog, metrics](const drogon::HttpRequestPtr& req, Callback&& callback,
                         const std::string& id) {
        RequestTimer timer(metrics, "PUT", "/api/v1/products/{id}");
        if (!catalog) {
          Send(timer, callback, NoCatalogResponse());
          return;
        }

        auto body = ParseJsonBody(req);
        if (!body || !body->isMember("isbn13") || !(*body)["isbn13"].isString()) {
          Send(timer, callback, BadRequest("JSON body must contain string 'isbn13' field"));
          return;
        }
        bool superseded = body->get("superseded", false).asBool();

        auto status = catalog->PutProduct(id, (*body)["isbn13"].asString(), superseded);
        if (!status.ok()) {
          Send(timer, callback, MakeErrorResponse(status, "PutProduct failed for '" + id + "'"));
          return;
        }

        Json::Value json;
        json["status"] = "ok";
        json["product_id"] = id;
        Send(timer, callback, JsonResponse(json, 201));
      },
      {drogon::Put});

  // GET /api/v1/products/{id}
  app.registerHandler(
      "/api/v1/products/{id}",
      [catalog, metrics](const drogon::HttpRequestPtr& req, Callback&& callback,
                         const std::string& id) {
        (void)req;
        RequestTimer timer(metrics, "GET", "/api/v1/products/{id}");
        if (!catalog) {
          Send(timer, callback, NoCatalogResponse());
          return;
        }

        ProductRecord record;
        auto status = catalog->GetProduct(id, &record);
        if (!status.ok()) {
          Send(timer, callback, MakeErrorResponse(status, "GetProduct failed for '" + id + "'"));
          return;
        }
        Send(timer, callback, JsonResponse(ProductToJson(record), 200));
      },
      {drogon::Get});

  // PUT /api/v1/upc/{upc}/{id} - Link a UPC to a product
  app.registerHandler(
      "/api/v1/upc/{upc}/{id}",
      [catalog, metrics](const drogon::HttpRequestPtr& req, Callback&& callback,
                         const std::string& upc, const std::string& id) {
        (void)req;
        RequestTimer timer(metrics, "PUT", "/api/v1/upc/{upc}/{id}");
        if (!catalog) {
          Send(timer, callback, NoCatalogResponse());
          return;
        }

        auto status = catalog->LinkUpc(upc, id);
        if (!status.ok()) {
          Send(timer, callback, MakeErrorResponse(status, "LinkUpc failed for '" + upc + "'"));
          return;
        }

        Json::Value json;
        json["status"] = "ok";
        json["upc"] = upc;
        json["product_id"] = id;
        Send(timer, callback, JsonResponse(json, 201));
      },
      {drogon::Put});

  // DELETE /api/v1/upc/{upc}/{id} - Remove a link
  app.registerHandler(
      "/api/v1/upc/{upc}/{id}",
      [catalog, metrics](const drogon::HttpRequestPtr& req, Callback&& callback,
                         const std::string& upc, const std::string& id) {
        (void)req;
        RequestTimer timer(metrics, "DELETE", "/api/v1/upc/{upc}/{id}");
        if (!catalog) {
          Send(timer, callback, NoCatalogResponse());
          return;
        }

        auto status = catalog->UnlinkUpc(upc, id);
        if (!status.ok()) {
          Send(timer, callback, MakeErrorResponse(status, "UnlinkUpc failed for '" + upc + "'"));
          return;
        }

        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(drogon::k204NoContent);
        Send(timer, callback, resp);
      },
      {drogon::Delete});

  // GET /api/v1/upc/{upc} - Products linked to a UPC
  app.registerHandler(
      "/api/v1/upc/{upc}",
      [catalog, metrics](const drogon::HttpRequestPtr& req, Callback&& callback,
                         const std::string& upc) {
        (void)req;
        RequestTimer timer(metrics, "GET", "/api/v1/upc/{upc}");
        if (!catalog) {
          Send(timer, callback, NoCatalogResponse());
          return;
        }

        std::vector<ProductRecord> records;
        auto status = catalog->FindByUpc(upc, &records);
        if (!status.ok()) {
          Send(timer, callback, MakeErrorResponse(status, "FindByUpc failed for '" + upc + "'"));
          return;
        }

        Json::Value json;
        json["upc"] = upc;
        json["products"] = Json::Value(Json::arrayValue);
        for (const auto& record : records) {
          json["products"].append(ProductToJson(record));
        }
        Send(timer, callback, JsonResponse(json, 200));
      },
      {drogon::Get});

  // ==========================================================================
  // Health Endpoints
  // ==========================================================================

  // GET /health - Liveness check
  app.registerHandler(
      "/health",
      [catalog](const drogon::HttpRequestPtr& req, Callback&& callback) {
        (void)req;
        Json::Value json;
        json["status"] = "healthy";
        if (!catalog) {
          json["catalog"] = "disabled";
        } else {
          json["catalog"] = catalog->IsOpen() ? "open" : "closed";
        }
        callback(JsonResponse(json, 200));
      },
      {drogon::Get});
}

}  // namespace bookland::server
