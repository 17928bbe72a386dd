// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#pragma once
#include "nlohmann/json.hpp"
#include <string>
#include <unordered_map>

using json = nlohmann::json;

// Standardized result envelope for every bundleloc mode.
// Her bundleloc modu icin standartlastirilmis sonuc zarfi.
// All responses follow: {ok, data, meta, error, message}
// Tum yanitlar su formati izler: {ok, data, meta, error, message}
namespace ApiResponse {

    // Build a successful response with data and optional meta/message
    // Veri ve istege bagli meta/mesaj ile basarili yanit olustur
    inline json ok(const json& data = nullptr,
                   const json& meta = nullptr,
                   const std::string& message = "") {
        json resp;
        resp["ok"] = true;
        resp["data"] = data;
        resp["meta"] = meta;
        resp["error"] = nullptr;
        resp["message"] = message.empty() ? json(nullptr) : json(message);
        return resp;
    }

    // Build an error response with an error code, a readable message and parameters.
    // Hata kodu, okunabilir mesaj ve parametrelerle hata yaniti olustur.
    // data may carry a partial report (counts reached before the failure).
    // data, hatadan once ulasilan sayilari iceren kismi bir rapor tasiyabilir.
    inline json error(const std::string& code,
                      const std::string& message = "",
                      const std::unordered_map<std::string, std::string>& params = {},
                      const json& data = nullptr) {
        json errObj;
        errObj["code"] = code;
        errObj["params"] = json::object();
        for (const auto& [k, v] : params) {
            errObj["params"][k] = v;
        }

        json resp;
        resp["ok"] = false;
        resp["data"] = data;
        resp["meta"] = nullptr;
        resp["error"] = errObj;
        resp["message"] = message.empty() ? json(nullptr) : json(message);
        return resp;
    }

    // True if j looks like an envelope built above
    // j yukarida olusturulan bir zarfa benziyorsa true
    inline bool isEnvelope(const json& j) {
        return j.is_object() && j.contains("ok") && j.contains("error") && j.contains("data");
    }

} // namespace ApiResponse
