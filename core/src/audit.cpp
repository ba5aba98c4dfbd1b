#include "opsgate/audit.h"
#include "opsgate/crypto.h"
#include "opsgate/text.h"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <vector>

namespace opsgate {

namespace {

const std::string kGenesis(64, '0');

void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = json::new_string(keys[i]);
            out << json::dump(ks);
            json_object_put(ks);
            out << ":";
            canonical_serialize(json::member(obj, keys[i]), out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json::dump(obj);
        break;
    }
}

// The hashed part of a record: everything except the chain fields.
json::Doc build_record(const std::string& name, json_object* payload, uint64_t seq, const std::string& ts) {
    json::Doc rec = json::Doc::object();
    json::set_string(rec.get(), "event", name);
    json::set(rec.get(), "payload", payload ? json_object_get(payload) : json_object_new_object());
    json::set_int(rec.get(), "seq", (int64_t)seq);
    json::set_string(rec.get(), "ts", ts);
    return rec;
}

std::string last_nonempty_line(std::ifstream& in) {
    std::string line, last;
    while (std::getline(in, line)) {
        if (!trim_ws(line).empty()) last = line;
    }
    return last;
}

} // namespace

std::string canonical_json(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

AuditLog::AuditLog(const std::string& path) : path_(path), chain_prev_(kGenesis) {
    if (path_.empty()) {
        std::cerr << "[audit] no audit log configured: destructive operations are not recorded\n";
        return;
    }

    {
        std::ifstream in(path_);
        if (in) {
            std::string last = last_nonempty_line(in);
            if (!last.empty()) {
                json::Doc d = json::parse(last);
                auto h = json::get_string(d.get(), "chain_hash");
                auto s = json::get_int(d.get(), "seq");
                if (!h || h->size() != 64 || !s) {
                    error_ = "cannot continue audit chain: last line of " + path_ + " is not an audit record";
                    std::cerr << "[audit] " << error_ << "\n";
                    return;
                }
                chain_prev_ = *h;
                seq_ = (uint64_t)*s;
            }
        }
    }

    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_) {
        error_ = "cannot open audit log: " + path_;
        std::cerr << "[audit] " << error_ << "\n";
        return;
    }
    enabled_ = true;
}

void AuditLog::event(const std::string& name, json_object* payload) {
    if (!enabled_) return;

    std::lock_guard<std::mutex> lk(mu_);
    const uint64_t seq = seq_ + 1;
    const std::string ts = iso_now();

    json::Doc rec = build_record(name, payload, seq, ts);
    const std::string record = canonical_json(rec.get());

    // chain_hash = SHA256(chain_prev || record)
    const std::string chain_hash = sha256_hex(chain_prev_ + record);

    json::set_string(rec.get(), "chain_hash", chain_hash);
    json::set_string(rec.get(), "chain_prev", chain_prev_);
    out_ << canonical_json(rec.get()) << "\n";
    out_.flush();
    if (!out_) {
        std::cerr << "[audit] write failed for " << path_ << " (event " << name << ")\n";
        out_.clear();
        return;
    }

    chain_prev_ = chain_hash;
    seq_ = seq;
}

uint64_t AuditLog::seq() const {
    std::lock_guard<std::mutex> lk(mu_);
    return seq_;
}

std::string AuditLog::chain_head() const {
    std::lock_guard<std::mutex> lk(mu_);
    return chain_prev_;
}

std::string verify_audit_chain(const std::string& path, size_t* records) {
    if (records) *records = 0;
    std::ifstream in(path);
    if (!in) return "cannot open " + path;

    std::string prev = kGenesis;
    std::string line;
    size_t n = 0;
    while (std::getline(in, line)) {
        if (trim_ws(line).empty()) continue;
        n++;
        const std::string where = "record " + std::to_string(n);

        json::Doc d = json::parse(line);
        if (!json::is_object(d.get())) return where + ": not a JSON object";
        auto hash = json::get_string(d.get(), "chain_hash");
        auto chain_prev = json::get_string(d.get(), "chain_prev");
        auto event = json::get_string(d.get(), "event");
        auto seq = json::get_int(d.get(), "seq");
        auto ts = json::get_string(d.get(), "ts");
        if (!hash || !chain_prev || !event || !seq || !ts) return where + ": missing fields";
        if (*chain_prev != prev) return where + ": chain_prev does not match previous hash";

        json::Doc rec = build_record(*event, json::member(d.get(), "payload"), (uint64_t)*seq, *ts);
        if (sha256_hex(prev + canonical_json(rec.get())) != *hash) return where + ": chain_hash mismatch";
        prev = *hash;
    }
    if (records) *records = n;
    return "";
}

} // namespace opsgate
