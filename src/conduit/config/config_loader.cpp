/**
 * @file config_loader.cpp
 * @brief nlohmann::json parser for the gateway configuration file.
 */
#include "conduit/config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>

#include <nlohmann/json.hpp>

#include "conduit/obs/logging.hpp"
#include "conduit/proxy/http_types.hpp"

namespace conduit::config {
    using json = nlohmann::json;
    using namespace conduit::config::constants;
    using std::chrono::milliseconds;

    namespace {

        [[noreturn]] void fail(const std::string& what) { throw ConfigError(what); }

        const json* member(const json& obj, const char* key) {
            auto it = obj.find(key);
            return (it == obj.end() || it->is_null()) ? nullptr : &*it;
        }

        std::int64_t read_int(const json& obj, const char* key, std::int64_t def, std::int64_t min,
                              std::int64_t max, const std::string& ctx) {
            const json* v = member(obj, key);
            if (!v) return def;
            if (!v->is_number_integer()) fail(ctx + "." + key + " must be an integer");
            const auto n = v->get<std::int64_t>();
            if (n < min || n > max) {
                fail(ctx + "." + key + " must be in [" + std::to_string(min) + ", " + std::to_string(max) + "]");
            }
            return n;
        }

        std::uint32_t read_u32(const json& obj, const char* key, std::uint32_t def, std::uint32_t min,
                               const std::string& ctx) {
            return static_cast<std::uint32_t>(
                read_int(obj, key, def, min, std::numeric_limits<std::uint32_t>::max(), ctx));
        }

        milliseconds read_ms(const json& obj, const char* key, milliseconds def, const std::string& ctx) {
            return milliseconds{read_int(obj, key, def.count(), 1, std::numeric_limits<std::int32_t>::max(), ctx)};
        }

        bool read_bool(const json& obj, const char* key, bool def, const std::string& ctx) {
            const json* v = member(obj, key);
            if (!v) return def;
            if (!v->is_boolean()) fail(ctx + "." + key + " must be a boolean");
            return v->get<bool>();
        }

        std::string read_string(const json& obj, const char* key, std::string def, const std::string& ctx) {
            const json* v = member(obj, key);
            if (!v) return def;
            if (!v->is_string()) fail(ctx + "." + key + " must be a string");
            return v->get<std::string>();
        }

        const json& section(const json& root, const char* key) {
            static const json empty = json::object();
            const json* v = member(root, key);
            if (!v) return empty;
            if (!v->is_object()) fail(std::string(key) + " must be an object");
            return *v;
        }

        routing::Algorithm read_algorithm(std::string_view name, const std::string& ctx) {
            auto a = routing::parse_algorithm(name);
            if (!a) fail(ctx + ": unknown load balancing algorithm '" + std::string(name) + "'");
            return *a;
        }

        std::string upper(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return s;
        }

        ServiceConfig parse_service(const json& j, const proxy::ProxyConfig& proxy, std::size_t idx) {
            const std::string ctx = "services[" + std::to_string(idx) + "]";
            if (!j.is_object()) fail(ctx + " must be an object");

            ServiceConfig sc;
            auto& def = sc.definition;
            def.name = read_string(j, "name", "", ctx);
            def.health_check_path = read_string(j, "health_check_path", HEALTH_PATH_DEFAULT, ctx);
            def.base_timeout = read_ms(j, "base_timeout_ms", milliseconds{SERVICE_BASE_TIMEOUT_MS}, ctx);
            def.retry_policy = routing::RetryPolicy{proxy.max_retries, proxy.base_delay};
            if (const json* rp = member(j, "retry_policy")) {
                if (!rp->is_object()) fail(ctx + ".retry_policy must be an object");
                def.retry_policy.max_retries = read_u32(*rp, "max_retries", proxy.max_retries, 0, ctx + ".retry_policy");
                def.retry_policy.base_delay = read_ms(*rp, "base_delay_ms", proxy.base_delay, ctx + ".retry_policy");
            }

            if (const json* insts = member(j, "instances")) {
                if (!insts->is_array()) fail(ctx + ".instances must be an array");
                std::size_t k = 0;
                for (const auto& ij : *insts) {
                    const std::string ictx = ctx + ".instances[" + std::to_string(k++) + "]";
                    if (!ij.is_object()) fail(ictx + " must be an object");
                    routing::ServiceInstance inst;
                    inst.id = read_string(ij, "id", "", ictx);
                    inst.url = read_string(ij, "url", "", ictx);
                    inst.weight = static_cast<std::uint32_t>(
                        read_int(ij, "weight", INSTANCE_WEIGHT_DEFAULT, 1, INSTANCE_WEIGHT_MAX, ictx));
                    sc.instances.push_back(std::move(inst));
                }
            }
            return sc;
        }

        routing::Route parse_route(const json& j, std::size_t idx) {
            const std::string ctx = "routes[" + std::to_string(idx) + "]";
            if (!j.is_object()) fail(ctx + " must be an object");

            routing::Route r;
            r.pattern = read_string(j, "path", "", ctx);
            r.target_service = read_string(j, "service", "", ctx);
            r.requires_auth = read_bool(j, "requires_auth", false, ctx);
            r.strip_path_prefix = read_bool(j, "strip_path_prefix", false, ctx);

            if (const json* m = member(j, "methods")) {
                if (!m->is_array()) fail(ctx + ".methods must be an array");
                r.methods.clear();
                for (const auto& mj : *m) {
                    if (!mj.is_string()) fail(ctx + ".methods must contain strings");
                    r.methods.push_back(upper(mj.get<std::string>()));
                }
                if (r.methods.empty()) r.methods.emplace_back("*");
            }
            if (member(j, "timeout_ms")) r.timeout = read_ms(j, "timeout_ms", milliseconds{PROXY_TIMEOUT_MS}, ctx);
            if (member(j, "retries")) r.max_retries = read_u32(j, "retries", PROXY_MAX_RETRIES, 0, ctx);
            if (const json* rl = member(j, "rate_limit")) {
                if (!rl->is_object()) fail(ctx + ".rate_limit must be an object");
                routing::RateLimit lim;
                lim.window = read_ms(*rl, "window_ms", lim.window, ctx + ".rate_limit");
                lim.max_requests = read_u32(*rl, "max_requests", lim.max_requests, 1, ctx + ".rate_limit");
                r.rate_limit = lim;
            }
            return r;
        }

        GatewayConfig parse(const json& root) {
            if (!root.is_object()) fail("configuration root must be an object");
            GatewayConfig cfg = Loader::load_defaults();

            const json& listen = section(root, "listen");
            cfg.listen.address = read_string(listen, "address", cfg.listen.address, "listen");
            cfg.listen.port = static_cast<std::uint16_t>(read_int(listen, "port", cfg.listen.port, 1, 65535, "listen"));
            cfg.listen.threads = static_cast<std::uint32_t>(read_int(listen, "threads", cfg.listen.threads, 1, 256, "listen"));

            cfg.log_level = read_string(section(root, "log"), "level", cfg.log_level, "log");

            const json& lb = section(root, "balancer");
            if (const json* a = member(lb, "algorithm")) {
                if (!a->is_string()) fail("balancer.algorithm must be a string");
                cfg.balancer.algorithm = read_algorithm(a->get<std::string>(), "balancer.algorithm");
            }
            cfg.thresholds.failure_threshold = read_u32(lb, "failure_threshold", LB_FAILURE_THRESHOLD, 1, "balancer");
            cfg.thresholds.recovery_threshold = read_u32(lb, "recovery_threshold", LB_RECOVERY_THRESHOLD, 1, "balancer");
            cfg.balancer.sticky_sessions = read_bool(lb, "sticky_sessions", LB_STICKY_SESSIONS, "balancer");
            cfg.balancer.session_ttl = read_ms(lb, "session_ttl_ms", milliseconds{LB_SESSION_TTL_MS}, "balancer");
            cfg.balancer.hash_seed = static_cast<std::uint64_t>(read_int(
                lb, "hash_seed", static_cast<std::int64_t>(LB_HASH_SEED_DEFAULT), 0,
                std::numeric_limits<std::int64_t>::max(), "balancer"));

            const json& hc = section(root, "health");
            cfg.health.interval = read_ms(hc, "interval_ms", milliseconds{HEALTH_INTERVAL_MS}, "health");
            cfg.health.timeout = read_ms(hc, "timeout_ms", milliseconds{HEALTH_TIMEOUT_MS}, "health");
            cfg.health.max_concurrency = read_u32(hc, "max_concurrency", HEALTH_MAX_CONCURRENCY, 1, "health");

            const json& cb = section(root, "circuit_breaker");
            cfg.breaker.failure_threshold = read_u32(cb, "failure_threshold", BREAKER_FAILURE_THRESHOLD, 1, "circuit_breaker");
            cfg.breaker.reset_timeout = read_ms(cb, "reset_timeout_ms", milliseconds{BREAKER_RESET_TIMEOUT_MS}, "circuit_breaker");

            const json& px = section(root, "proxy");
            cfg.proxy.timeout = read_ms(px, "timeout_ms", milliseconds{PROXY_TIMEOUT_MS}, "proxy");
            cfg.proxy.max_retries = read_u32(px, "max_retries", PROXY_MAX_RETRIES, 0, "proxy");
            cfg.proxy.base_delay = read_ms(px, "base_delay_ms", milliseconds{PROXY_BASE_DELAY_MS}, "proxy");
            cfg.proxy.max_delay = read_ms(px, "max_delay_ms", milliseconds{PROXY_MAX_DELAY_MS}, "proxy");

            if (const json* svcs = member(root, "services")) {
                if (!svcs->is_array()) fail("services must be an array");
                std::size_t i = 0;
                for (const auto& sj : *svcs) cfg.services.push_back(parse_service(sj, cfg.proxy, i++));
            }
            if (const json* routes = member(root, "routes")) {
                if (!routes->is_array()) fail("routes must be an array");
                std::size_t i = 0;
                for (const auto& rj : *routes) cfg.routes.push_back(parse_route(rj, i++));
            }
            return cfg;
        }

        std::int64_t env_int(const std::string& name, const std::string& raw, std::int64_t min, std::int64_t max) {
            std::int64_t v = 0;
            const char* first = raw.data();
            const char* last = raw.data() + raw.size();
            auto [ptr, ec] = std::from_chars(first, last, v);
            if (ec != std::errc{} || ptr != last || v < min || v > max) {
                fail(name + "='" + raw + "' must be an integer in [" + std::to_string(min) + ", " + std::to_string(max) + "]");
            }
            return v;
        }

        bool env_bool(const std::string& name, const std::string& raw) {
            if (raw == "1" || raw == "true" || raw == "yes" || raw == "on") return true;
            if (raw == "0" || raw == "false" || raw == "no" || raw == "off") return false;
            fail(name + "='" + raw + "' must be a boolean");
        }

    } // namespace

    std::optional<std::string> process_env(const char* name) {
        if (const char* v = std::getenv(name)) return std::string(v);
        return std::nullopt;
    }

    GatewayConfig Loader::load_defaults() {
        GatewayConfig cfg;
        cfg.thresholds = routing::HealthThresholds{};  // LB_* hysteresis defaults
        cfg.proxy = proxy::ProxyConfig{};
        return cfg;
    }

    GatewayConfig Loader::load_from_file(const std::string& path, const EnvLookup& env) {
        std::ifstream in(path);
        if (!in) fail("cannot open configuration file '" + path + "'");
        std::ostringstream ss;
        ss << in.rdbuf();
        return load_from_json(ss.str(), env);
    }

    GatewayConfig Loader::load_from_json(std::string_view text, const EnvLookup& env) {
        json root;
        try {
            root = json::parse(text.begin(), text.end());
        } catch (const json::parse_error& e) {
            fail(std::string("malformed configuration JSON: ") + e.what());
        }
        GatewayConfig cfg = parse(root);
        apply_env(cfg, env);
        validate(cfg);
        return cfg;
    }

    void Loader::apply_env(GatewayConfig& cfg, const EnvLookup& env) {
        constexpr std::int64_t ms_max = std::numeric_limits<std::int32_t>::max();
        if (auto v = env("CONDUIT_LISTEN_PORT"))
            cfg.listen.port = static_cast<std::uint16_t>(env_int("CONDUIT_LISTEN_PORT", *v, 1, 65535));
        if (auto v = env("CONDUIT_LB_ALGORITHM"))
            cfg.balancer.algorithm = read_algorithm(*v, "CONDUIT_LB_ALGORITHM");
        if (auto v = env("CONDUIT_HEALTH_INTERVAL_MS"))
            cfg.health.interval = milliseconds{env_int("CONDUIT_HEALTH_INTERVAL_MS", *v, 1, ms_max)};
        if (auto v = env("CONDUIT_PROXY_TIMEOUT_MS"))
            cfg.proxy.timeout = milliseconds{env_int("CONDUIT_PROXY_TIMEOUT_MS", *v, 1, ms_max)};
        if (auto v = env("CONDUIT_PROXY_MAX_RETRIES"))
            cfg.proxy.max_retries = static_cast<std::uint32_t>(env_int("CONDUIT_PROXY_MAX_RETRIES", *v, 0, 100));
        if (auto v = env("CONDUIT_PROXY_BASE_DELAY_MS"))
            cfg.proxy.base_delay = milliseconds{env_int("CONDUIT_PROXY_BASE_DELAY_MS", *v, 1, ms_max)};
        if (auto v = env("CONDUIT_STICKY_SESSIONS"))
            cfg.balancer.sticky_sessions = env_bool("CONDUIT_STICKY_SESSIONS", *v);
        if (auto v = env("CONDUIT_LOG_LEVEL"))
            cfg.log_level = *v;
    }

    void Loader::validate(const GatewayConfig& cfg) {
        if (!obs::is_valid_log_level(cfg.log_level)) fail("log.level '" + cfg.log_level + "' is not a valid level");
        if (cfg.listen.address.empty()) fail("listen.address must not be empty");
        if (cfg.proxy.max_delay < cfg.proxy.base_delay) fail("proxy.max_delay_ms must be >= proxy.base_delay_ms");

        std::set<std::string, std::less<>> names;
        std::set<std::string, std::less<>> instance_ids;
        for (const auto& sc : cfg.services) {
            const auto& name = sc.definition.name;
            if (name.empty() || name.size() > routing::Limits::MaxIdLen) fail("service name '" + name + "' is invalid");
            if (!names.insert(name).second) fail("duplicate service '" + name + "'");
            if (sc.definition.health_check_path.empty() || sc.definition.health_check_path.front() != '/')
                fail("service '" + name + "': health_check_path must start with '/'");
            if (sc.instances.size() > routing::Limits::MaxInstancesPerService)
                fail("service '" + name + "' has too many instances");
            for (const auto& inst : sc.instances) {
                if (inst.id.empty() || inst.id.size() > routing::Limits::MaxIdLen)
                    fail("service '" + name + "': instance id '" + inst.id + "' is invalid");
                if (!instance_ids.insert(inst.id).second) fail("duplicate instance id '" + inst.id + "'");
                if (inst.weight < 1) fail("instance '" + inst.id + "': weight must be >= 1");
                if (!proxy::parse_http_url(inst.url)) fail("instance '" + inst.id + "': malformed url '" + inst.url + "'");
            }
        }

        for (const auto& r : cfg.routes) {
            if (r.pattern.empty() || r.pattern.front() != '/') fail("route path '" + r.pattern + "' must start with '/'");
            if (!names.contains(r.target_service))
                fail("route '" + r.pattern + "' targets unknown service '" + r.target_service + "'");
        }
        if (cfg.routes.size() > routing::Limits::MaxRoutes) fail("too many routes");
    }

} // namespace conduit::config
