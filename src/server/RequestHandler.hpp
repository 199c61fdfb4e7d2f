#pragma once

#include "events/ClickPipeline.hpp"
#include "store/KeywordStore.hpp"
#include "store/LinkStore.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace slugline {
namespace server {

using json = nlohmann::json;

/**
 * Transport-independent view of an incoming request
 */
struct Request {
    std::string method;                  // "GET", "HEAD", ...
    std::string target;                  // Path plus optional query string
    std::string remoteAddress;           // Client IP, hashed before storage
    std::string userAgent;
    std::string referrer;
};

/**
 * Response produced by the handler, serialized by HttpSession
 */
struct Reply {
    unsigned status = 200;
    std::string contentType = "application/json";
    std::string body;
    std::string location;                // Set for redirects only
};

/**
 * Gestionnaire de requêtes - routes the redirect front-end
 *
 *   GET /api/health         -> 200 JSON
 *   GET /api/keywords       -> 200 JSON array of keyword names
 *   GET /api/links/{slug}   -> 200 JSON link, 404 if unknown or not public
 *   GET /metrics            -> 200 text/plain
 *   GET /{slug}             -> 302 to the link URL, click enqueued
 */
class RequestHandler {
public:
    RequestHandler(store::LinkStore& links, store::KeywordStore& keywords,
                   events::ClickPipeline& clicks);

    /**
     * @brief Route one request. Never throws: store failures become
     * 404 (NotFound) or 500 JSON replies.
     */
    Reply handle(const Request& req);

    json handleHealth();
    json handleKeywords();

    /**
     * Requests carry no identity, so private and secure links are reported
     * as missing
     */
    json handleGetLink(const std::string& slug);
    std::string handleMetrics();
    Reply handleRedirect(const Request& req, const std::string& slug);

    static json linkToJson(const store::Link& link);

private:
    static Reply jsonReply(unsigned status, const json& body);
    static Reply errorReply(unsigned status, const std::string& message);

    store::LinkStore& m_links;
    store::KeywordStore& m_keywords;
    events::ClickPipeline& m_clicks;
};

} // namespace server
} // namespace slugline
