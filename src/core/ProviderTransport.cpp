// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#include "ProviderTransport.h"
#include "Logger.h"
#include <httplib.h>

bool HttpsTransport::tlsAvailable() {
#ifdef BUNDLELOC_TLS_ENABLED
    return true;
#else
    return false;
#endif
}

// One blocking POST per call, timeouts applied to connect, read and write
// Cagri basina bir engelleyici POST, baglanma, okuma ve yazmaya zaman asimi uygulanir
TransportResponse HttpsTransport::postForm(const std::string& host,
                                           const std::string& path,
                                           const FieldList& form,
                                           const FieldList& headers,
                                           int timeoutSec) {
    TransportResponse out;

#ifdef BUNDLELOC_TLS_ENABLED
    httplib::SSLClient cli(host, 443);
    cli.enable_server_certificate_verification(true);
    cli.set_connection_timeout(timeoutSec, 0);
    cli.set_read_timeout(timeoutSec, 0);
    cli.set_write_timeout(timeoutSec, 0);

    httplib::Headers hdrs;
    for (const auto& [name, value] : headers) {
        hdrs.emplace(name, value);
    }
    httplib::Params params;
    for (const auto& [name, value] : form) {
        params.emplace(name, value);
    }

    auto res = cli.Post(path, hdrs, params);
    if (!res) {
        out.error = httplib::to_string(res.error());
        LOG_DEBUG("[DeepL] POST ", host, path, " failed: ", out.error);
        return out;
    }

    out.ok = true;
    out.status = res->status;
    out.body = res->body;
    return out;
#else
    (void)form;
    (void)headers;
    (void)timeoutSec;
    out.error = "built without TLS support (configure with -DBUNDLELOC_USE_TLS=ON)";
    LOG_WARN("[DeepL] Cannot reach https://", host, path, ": ", out.error);
    return out;
#endif
}
