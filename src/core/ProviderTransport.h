// bundleloc — No impositions.
// Copyright (c) 2025 Berk Coşar <lookmainpoint@gmail.com>
// Licensed under the GNU Affero General Public License v3.0.
// See LICENSE file in the project root for full license text.

#pragma once
#include <string>
#include <vector>
#include <utility>

// Ordered name/value pairs; names may repeat (form fields, headers)
// Sirali ad/deger ciftleri; adlar tekrar edebilir (form alanlari, basliklar)
using FieldList = std::vector<std::pair<std::string, std::string>>;

// Outcome of one HTTP exchange
// Tek bir HTTP alisverisinin sonucu
struct TransportResponse {
    bool ok = false;      // Request reached the server and got a reply / Istek sunucuya ulasti ve yanit aldi
    int status = 0;       // HTTP status code / HTTP durum kodu
    std::string body;     // Response body / Yanit govdesi
    std::string error;    // Transport-level error text / Tasima seviyesi hata metni
};

// Network seam for the live translation provider.
// Canli ceviri saglayicisi icin ag dikisi.
class ProviderTransport {
public:
    virtual ~ProviderTransport() = default;

    // POST an application/x-www-form-urlencoded body to https://host + path
    // https://host + path adresine application/x-www-form-urlencoded govde gonder
    virtual TransportResponse postForm(const std::string& host,
                                       const std::string& path,
                                       const FieldList& form,
                                       const FieldList& headers,
                                       int timeoutSec) = 0;
};

// cpp-httplib HTTPS client. Without TLS support compiled in every call fails cleanly.
// cpp-httplib HTTPS istemcisi. TLS destegi derlenmemisse her cagri temiz sekilde basarisiz olur.
class HttpsTransport : public ProviderTransport {
public:
    TransportResponse postForm(const std::string& host,
                               const std::string& path,
                               const FieldList& form,
                               const FieldList& headers,
                               int timeoutSec) override;

    // Whether this build can reach HTTPS endpoints
    // Bu derlemenin HTTPS uc noktalarina ulasip ulasamayacagi
    static bool tlsAvailable();
};
