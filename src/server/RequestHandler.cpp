#include "server/RequestHandler.hpp"
#include "server/Logger.hpp"
#include "server/Metrics.hpp"
#include "store/ClickStore.hpp"
#include "store/StoreError.hpp"

namespace slugline {
namespace server {

namespace {

const std::string kLinksPrefix = "/api/links/";

std::string stripQuery(const std::string& target) {
    size_t pos = target.find_first_of("?#");
    return pos == std::string::npos ? target : target.substr(0, pos);
}

} // anonymous namespace

RequestHandler::RequestHandler(store::LinkStore& links, store::KeywordStore& keywords,
                               events::ClickPipeline& clicks)
    : m_links(links)
    , m_keywords(keywords)
    , m_clicks(clicks)
{
}

Reply RequestHandler::jsonReply(unsigned status, const json& body) {
    Reply reply;
    reply.status = status;
    reply.body = body.dump();
    return reply;
}

Reply RequestHandler::errorReply(unsigned status, const std::string& message) {
    return jsonReply(status, json{{"status", "error"}, {"message", message}});
}

json RequestHandler::linkToJson(const store::Link& link) {
    json owners = json::array();
    for (const auto& owner : link.owners) {
        owners.push_back({{"user_id", owner.userId}, {"is_primary", owner.isPrimary}});
    }

    json tags = json::array();
    for (const auto& tag : link.tags) {
        tags.push_back({{"id", tag.id}, {"name", tag.name}, {"slug", tag.slug}});
    }

    return {
        {"id", link.id},
        {"slug", link.slug},
        {"url", link.url},
        {"title", link.title},
        {"description", link.description},
        {"visibility", store::visibilityToString(link.visibility)},
        {"created_at", link.createdAt},
        {"updated_at", link.updatedAt},
        {"owners", owners},
        {"tags", tags}
    };
}

json RequestHandler::handleHealth() {
    auto stats = m_clicks.stats();
    return {
        {"status", "ok"},
        {"clicks", {
            {"queued", m_clicks.queued()},
            {"capacity", m_clicks.capacity()},
            {"persisted", stats.persisted},
            {"dropped", stats.dropped}
        }}
    };
}

json RequestHandler::handleKeywords() {
    json names = json::array();
    for (const auto& keyword : m_keywords.list()) {
        names.push_back(keyword.keyword);
    }
    return names;
}

json RequestHandler::handleGetLink(const std::string& slug) {
    auto link = m_links.getBySlug(slug);
    if (!link || link->visibility != store::Visibility::Public) {
        throw store::StoreError(store::ErrorKind::NotFound, "link not found: " + slug);
    }
    return linkToJson(*link);
}

std::string RequestHandler::handleMetrics() {
    return Metrics::instance().formatText();
}

Reply RequestHandler::handleRedirect(const Request& req, const std::string& slug) {
    ScopedTimer timer(metric::kRedirectDurationMs);

    auto link = m_links.getBySlug(slug);
    if (!link) {
        Metrics::instance().increment(metric::kRedirectsNotFoundTotal);
        return errorReply(404, "link not found: " + slug);
    }

    store::ClickEvent event;
    event.linkId = link->id;
    event.ipHash = store::ClickStore::hashIp(req.remoteAddress);
    event.userAgent = req.userAgent;
    event.referrer = req.referrer;
    m_clicks.tryEnqueue(std::move(event));

    Metrics::instance().increment(metric::kRedirectsTotal);

    Reply reply;
    reply.status = 302;
    reply.contentType = "text/plain";
    reply.location = link->url;
    return reply;
}

Reply RequestHandler::handle(const Request& req) {
    std::string path = stripQuery(req.target);

    if (req.method != "GET" && req.method != "HEAD") {
        return errorReply(405, "method not allowed: " + req.method);
    }

    try {
        if (path == "/api/health") {
            return jsonReply(200, handleHealth());
        }

        if (path == "/api/keywords") {
            return jsonReply(200, handleKeywords());
        }

        if (path == "/metrics") {
            Reply reply;
            reply.contentType = "text/plain; version=0.0.4";
            reply.body = handleMetrics();
            return reply;
        }

        if (path.rfind(kLinksPrefix, 0) == 0) {
            std::string slug = path.substr(kLinksPrefix.size());
            if (slug.empty() || slug.find('/') != std::string::npos) {
                return errorReply(404, "not found: " + path);
            }
            return jsonReply(200, handleGetLink(slug));
        }

        // Everything else is /{slug}
        std::string slug = path.size() > 1 ? path.substr(1) : "";
        if (slug.empty() || slug.find('/') != std::string::npos) {
            return errorReply(404, "not found: " + path);
        }
        return handleRedirect(req, slug);

    } catch (const store::StoreError& e) {
        if (e.kind() == store::ErrorKind::NotFound) {
            return errorReply(404, e.what());
        }
        LOG_ERROR("Request " + req.method + " " + path + " failed (" +
                  store::errorKindName(e.kind()) + "): " + e.what());
        return errorReply(500, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("Request " + req.method + " " + path + " failed: " + e.what());
        return errorReply(500, e.what());
    }
}

} // namespace server
} // namespace slugline
