#include "cat_engine_bridge.h"

#include <cstdlib>
#include <cstring>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "cat/session_engine.hpp"
#include "src/json_bridge.hpp"

namespace {

struct EngineState {
  std::mutex mutex;
  std::unique_ptr<cat::SessionEngine> engine;
};

EngineState& state() {
  static EngineState instance;
  return instance;
}

char* copy_string(const std::string& value) {
  char* buffer = static_cast<char*>(std::malloc(value.size() + 1));
  if (!buffer) {
    return nullptr;
  }
  std::memcpy(buffer, value.c_str(), value.size());
  buffer[value.size()] = '\0';
  return buffer;
}

char* copy_json(const nlohmann::json& json) {
  return copy_string(json.dump());
}

nlohmann::json ok_envelope() {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "ok";
  return payload;
}

nlohmann::json error_envelope(const std::string& kind, const std::string& message) {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "error";
  payload["kind"] = kind;
  payload["message"] = message;
  return payload;
}

struct NoItemBank : std::runtime_error {
  NoItemBank() : std::runtime_error("No item bank loaded; call cat_load_item_bank first") {}
};

cat::SessionEngine& require_engine() {
  auto& s = state();
  if (!s.engine) {
    throw NoItemBank();
  }
  return *s.engine;
}

std::string require_text(const char* text, const char* what) {
  if (!text) {
    throw std::invalid_argument(std::string("Missing ") + what);
  }
  return std::string(text);
}

// Runs `body` under the bridge mutex and turns every exception into an
// error envelope.
template <typename Body>
char* guarded(Body&& body) {
  try {
    auto& s = state();
    std::scoped_lock guard(s.mutex);
    return copy_json(body());
  } catch (const cat::CatError& ex) {
    return copy_json(error_envelope(cat::to_string(ex.kind()), ex.what()));
  } catch (const nlohmann::json::exception& ex) {
    return copy_json(error_envelope("InvalidJson", ex.what()));
  } catch (const std::invalid_argument& ex) {
    return copy_json(error_envelope("InvalidArgument", ex.what()));
  } catch (const NoItemBank& ex) {
    return copy_json(error_envelope("NoItemBank", ex.what()));
  } catch (const std::exception& ex) {
    return copy_json(error_envelope("Internal", ex.what()));
  }
}

nlohmann::json next_payload(const cat::SessionEngine::Next& next) {
  nlohmann::json payload = ok_envelope();
  payload.update(cat::bridge::to_json(next));
  return payload;
}

} // namespace

extern "C" {

char* cat_load_item_bank(const char* bank_json, const char* config_json) {
  return guarded([&] {
    auto bank = std::make_shared<const cat::ItemBank>(cat::bridge::item_bank_from_json(
        nlohmann::json::parse(require_text(bank_json, "item bank json"))));
    cat::SessionConfig config;
    if (config_json && *config_json) {
      config = cat::bridge::session_config_from_json(nlohmann::json::parse(config_json));
    }
    const auto item_count = bank->size();
    state().engine = cat::make_engine(std::move(bank), config);
    nlohmann::json payload = ok_envelope();
    payload["item_count"] = item_count;
    return payload;
  });
}

char* cat_start_session(const char* request_json) {
  return guarded([&] {
    auto request = cat::bridge::session_request_from_json(
        nlohmann::json::parse(require_text(request_json, "session request json")));
    auto& engine = require_engine();
    nlohmann::json payload = ok_envelope();
    payload["session_id"] = engine.create_session(request);
    return payload;
  });
}

char* cat_next_item(const char* session_id) {
  return guarded([&] {
    return next_payload(require_engine().next_item(require_text(session_id, "session id")));
  });
}

char* cat_submit_response(const char* session_id, const char* submission_json) {
  return guarded([&] {
    auto submission = cat::bridge::response_submission_from_json(
        nlohmann::json::parse(require_text(submission_json, "submission json")));
    return next_payload(
        require_engine().submit_response(require_text(session_id, "session id"), submission));
  });
}

char* cat_session_report(const char* session_id) {
  return guarded([&] {
    nlohmann::json payload = ok_envelope();
    payload["report"] =
        cat::bridge::to_json(require_engine().report(require_text(session_id, "session id")));
    return payload;
  });
}

char* cat_end_session(const char* session_id) {
  return guarded([&] {
    nlohmann::json payload = ok_envelope();
    payload["report"] = cat::bridge::to_json(
        require_engine().end_session(require_text(session_id, "session id")));
    return payload;
  });
}

char* cat_serialize_checkpoint(const char* session_id) {
  return guarded([&] {
    nlohmann::json payload = ok_envelope();
    payload["snapshot"] = require_engine().snapshot(require_text(session_id, "session id"));
    return payload;
  });
}

char* cat_deserialize_checkpoint(const char* snapshot_json) {
  return guarded([&] {
    const auto text = require_text(snapshot_json, "snapshot json");
    nlohmann::json parsed;
    try {
      parsed = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
      throw cat::CatError(cat::ErrorKind::InvalidSnapshot,
                          std::string("Invalid session snapshot: ") + ex.what());
    }
    nlohmann::json payload = ok_envelope();
    payload["session_id"] = require_engine().restore(parsed);
    return payload;
  });
}

void cat_free_string(char* ptr) {
  std::free(ptr);
}

} // extern "C"
