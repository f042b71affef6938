#include "JSONWriter.h"
#include "JsonUtil.h"
#include "BuildInfo.h"
#include "../discovery/CidrExpander.h"
#include <algorithm>
#include <cstdlib>
#include <map>
#include <sstream>
#include <vector>
#include <sys/utsname.h>

namespace cam_scan {
namespace {
    struct CanonVal {
        enum Type { T_OBJ, T_ARR, T_STR, T_NUM, T_BOOL, T_NULL } type = T_OBJ;
        std::map<std::string, CanonVal> obj;
        std::vector<CanonVal> arr;
        std::string str; // for string & number token text
        bool b = false;
        CanonVal() = default;
        explicit CanonVal(Type t): type(t) {}
    };

    using jsonutil::escape; using jsonutil::time_to_iso;

    static void canon_emit(const CanonVal& v, std::ostream& os);

    static void emit_array(const CanonVal& v, std::ostream& os) {
        os << '[';
        bool first = true;
        for (const auto& e : v.arr) {
            if (!first) os << ',';
            first = false;
            canon_emit(e, os);
        }
        os << ']';
    }

    static void emit_object(const CanonVal& v, std::ostream& os) {
        os << '{';
        bool first = true;
        for (const auto& kv : v.obj) {
            if (!first) os << ',';
            first = false;
            os << '"' << escape(kv.first) << '"' << ':';
            canon_emit(kv.second, os);
        }
        os << '}';
    }

    static void canon_emit(const CanonVal& v, std::ostream& os) {
        switch (v.type) {
            case CanonVal::T_STR: os << '"' << escape(v.str) << '"'; break;
            case CanonVal::T_NUM: os << v.str; break;
            case CanonVal::T_BOOL: os << (v.b ? "true" : "false"); break;
            case CanonVal::T_NULL: os << "null"; break;
            case CanonVal::T_ARR: emit_array(v, os); break;
            case CanonVal::T_OBJ: emit_object(v, os); break;
        }
    }

    static void put_str(CanonVal& o, const std::string& k, const std::string& v) {
        o.obj[k].type = CanonVal::T_STR;
        o.obj[k].str = v;
    }
    static void put_num(CanonVal& o, const std::string& k, long long v) {
        o.obj[k].type = CanonVal::T_NUM;
        o.obj[k].str = std::to_string(v);
    }
    static void put_bool(CanonVal& o, const std::string& k, bool v) {
        o.obj[k].type = CanonVal::T_BOOL;
        o.obj[k].b = v;
    }
    static void put_opt(CanonVal& o, const std::string& k, const std::optional<std::string>& v) {
        if (v) put_str(o, k, *v);
        else o.obj[k].type = CanonVal::T_NULL;
    }

    static bool zero_time() { return std::getenv("CAM_SCAN_CANON_TIME_ZERO") != nullptr; }

    static std::string iso_or_blank(std::chrono::system_clock::time_point tp) {
        return zero_time() ? "" : time_to_iso(tp);
    }

    static std::string local_hostname() {
        struct utsname u{};
        if (uname(&u) == 0) return u.nodename;
        return "";
    }

    static std::vector<const DeviceRecord*> select_devices(const ScanResult& result, const Config& cfg) {
        std::vector<const DeviceRecord*> out;
        for (const auto& d : result.devices) {
            if (!cfg.class_filter.empty()) {
                auto name = device_class_to_string(d.device_class);
                if (std::find(cfg.class_filter.begin(), cfg.class_filter.end(), name) == cfg.class_filter.end()) continue;
            }
            out.push_back(&d);
        }
        if (cfg.canonical) {
            auto key = [](const DeviceRecord* d) { uint32_t ip = 0; parse_ipv4(d->address, ip); return ip; };
            std::stable_sort(out.begin(), out.end(), [&](const DeviceRecord* a, const DeviceRecord* b) {
                return key(a) < key(b);
            });
        }
        return out;
    }

    static CanonVal build_meta_object(const ScanResult& result, const Config& cfg) {
        CanonVal meta{CanonVal::T_OBJ};
        put_str(meta, "json_schema_version", "1");
        put_str(meta, "tool_version", buildinfo::APP_VERSION);
        if (!cfg.no_hostname_meta) put_str(meta, "hostname", local_hostname());
        if (zero_time()) put_str(meta, "normalized_time", "true");
        CanonVal subnets{CanonVal::T_ARR};
        for (const auto& s : result.subnets) {
            CanonVal v{CanonVal::T_STR}; v.str = s;
            subnets.arr.push_back(std::move(v));
        }
        meta.obj["subnets"] = std::move(subnets);
        return meta;
    }

    static CanonVal build_summary_object(const ScanResult& result, const std::vector<const DeviceRecord*>& emitted) {
        CanonVal summary{CanonVal::T_OBJ};
        long long duration_ms = 0;
        if (!zero_time() && result.finished_at >= result.started_at) {
            duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(result.finished_at - result.started_at).count();
        }
        put_str(summary, "started_at", iso_or_blank(result.started_at));
        put_str(summary, "finished_at", iso_or_blank(result.finished_at));
        put_num(summary, "duration_ms", duration_ms);
        put_num(summary, "addresses_total", static_cast<long long>(result.addresses_total));
        put_num(summary, "addresses_probed", static_cast<long long>(result.addresses_probed));
        put_num(summary, "device_count_total", static_cast<long long>(result.devices.size()));
        put_num(summary, "device_count", static_cast<long long>(emitted.size()));
        put_bool(summary, "cancelled", result.cancelled);

        // counted over the emitted devices, like device_count
        std::map<std::string, size_t> counts = {{"camera", 0}, {"infrastructure", 0}, {"unknown", 0}};
        for (const auto* d : emitted) counts[device_class_to_string(d->device_class)]++;
        CanonVal cc{CanonVal::T_OBJ};
        for (const auto& kv : counts) put_num(cc, kv.first, static_cast<long long>(kv.second));
        summary.obj["class_counts"] = std::move(cc);
        return summary;
    }

    static CanonVal build_device_object(const DeviceRecord& d) {
        CanonVal dv{CanonVal::T_OBJ};
        put_str(dv, "address", d.address);
        put_opt(dv, "mac", d.mac);
        put_opt(dv, "manufacturer", d.manufacturer);
        put_str(dv, "device_class", device_class_to_string(d.device_class));
        put_str(dv, "discovered_at", iso_or_blank(d.discovered_at));
        CanonVal ports{CanonVal::T_OBJ};
        put_bool(ports, "rtsp", d.open_ports.rtsp);
        put_bool(ports, "http", d.open_ports.http);
        put_bool(ports, "https", d.open_ports.https);
        put_bool(ports, "http_alt", d.open_ports.http_alt);
        dv.obj["ports"] = std::move(ports);
        return dv;
    }

    static std::string emit_line(const CanonVal& v) {
        std::ostringstream os;
        canon_emit(v, os);
        return os.str();
    }

    static std::string generate_ndjson_output(const CanonVal& meta, const CanonVal& summary,
                                              const std::vector<const DeviceRecord*>& devices) {
        std::ostringstream nd;
        CanonVal m = meta; put_str(m, "type", "meta");
        nd << emit_line(m) << "\n";
        CanonVal s = summary; put_str(s, "type", "summary");
        nd << emit_line(s) << "\n";
        for (const auto* d : devices) {
            CanonVal dv = build_device_object(*d);
            put_str(dv, "type", "device");
            nd << emit_line(dv) << "\n";
        }
        return nd.str();
    }

    static std::string pretty_print_json(const std::string& compact_json) {
        std::string out;
        out.reserve(compact_json.size() * 2);
        int depth = 0;
        bool in_string = false;
        bool esc = false;

        auto indent = [&](int d) {
            for (int i = 0; i < d; i++) out.append("  ");
        };

        for (size_t i = 0; i < compact_json.size(); ++i) {
            char c = compact_json[i];
            if (in_string) {
                out.push_back(c);
                if (esc) esc = false;
                else if (c == '\\') esc = true;
                else if (c == '"') in_string = false;
                continue;
            }
            switch (c) {
                case '"':
                    in_string = true;
                    out.push_back(c);
                    break;
                case '{':
                case '[': {
                    char close = c == '{' ? '}' : ']';
                    out.push_back(c);
                    if (i + 1 < compact_json.size() && compact_json[i + 1] == close) {
                        out.push_back(close); // keep empty containers on one line
                        ++i;
                        break;
                    }
                    out.push_back('\n');
                    depth++;
                    indent(depth);
                    break;
                }
                case '}':
                case ']':
                    out.push_back('\n');
                    depth--;
                    if (depth < 0) depth = 0;
                    indent(depth);
                    out.push_back(c);
                    break;
                case ',':
                    out.push_back(c);
                    out.push_back('\n');
                    indent(depth);
                    break;
                case ':':
                    out.push_back(c);
                    out.push_back(' ');
                    break;
                default:
                    out.push_back(c);
                    break;
            }
        }
        out.push_back('\n');
        return out;
    }
}

std::string JSONWriter::write(const ScanResult& result, const Config& cfg) const {
    auto devices = select_devices(result, cfg);
    CanonVal meta = build_meta_object(result, cfg);
    CanonVal summary = build_summary_object(result, devices);

    if (cfg.ndjson) {
        return generate_ndjson_output(meta, summary, devices);
    }

    CanonVal root{CanonVal::T_OBJ};
    root.obj["meta"] = std::move(meta);
    root.obj["summary"] = std::move(summary);
    CanonVal arr{CanonVal::T_ARR};
    for (const auto* d : devices) arr.arr.push_back(build_device_object(*d));
    root.obj["devices"] = std::move(arr);

    std::string compact = emit_line(root);
    if (cfg.pretty && !cfg.compact) {
        return pretty_print_json(compact);
    }
    return compact;
}

}
