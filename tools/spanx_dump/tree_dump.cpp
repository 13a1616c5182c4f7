#include "dump.hpp"

#include <cstdio>
#include <sstream>
#include <string>

namespace spanx_dump {

using spanx::span;
using spanx::spanned;

std::string escape_json(std::string_view sv) {
    std::string out;
    out.reserve(sv.size() + 8);
    for (char c : sv) {
        switch (c) {
        case '\"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                out += buf;
            } else {
                out.push_back(c);
            }
            break;
        }
    }
    return out;
}

std::string span_json(span s) {
    return "[" + std::to_string(s.start()) + "," + std::to_string(s.end()) + "]";
}

namespace {

void write_text(std::ostringstream& os, const spanned<std::string_view>& v) {
    os << "{\"text\":\"" << escape_json(v.value) << "\",\"span\":" << span_json(v.span) << "}";
}

void write_headers(std::ostringstream& os, const spanx::http::header_list& headers) {
    os << "[";
    bool first = true;
    for (const auto& h : headers) {
        if (!first) {
            os << ",";
        }
        first = false;
        os << "{\"span\":" << span_json(h.span) << ",\"name\":";
        write_text(os, h->name);
        os << ",\"value\":";
        write_text(os, h->value);
        os << "}";
    }
    os << "]";
}

void write_body(std::ostringstream& os, const spanned<spanx::http::body>& b) {
    os << "{\"kind\":\"" << spanx::http::body_kind_to_string(b->kind) << "\"";
    os << ",\"span\":" << span_json(b.span);
    os << ",\"payload_size\":" << b->payload_size();
    if (b->kind == spanx::http::body_kind::chunked) {
        os << ",\"chunks\":[";
        bool first = true;
        for (const auto& c : b->chunks) {
            if (!first) {
                os << ",";
            }
            first = false;
            os << "{\"span\":" << span_json(c.span) << ",\"size\":" << c->size;
            os << ",\"size_text\":";
            write_text(os, c->size_text);
            os << ",\"extensions\":";
            write_text(os, c->extensions);
            os << ",\"data\":" << span_json(c->data.span) << "}";
        }
        os << "],\"trailers\":";
        write_headers(os, b->trailers);
    }
    os << "}";
}

class tree_writer : public spanx::json::visitor {
public:
    explicit tree_writer(std::ostringstream& os) : os_(os) {}

    void visit_null(span s) override {
        open("null", s);
        os_ << "}";
    }

    void visit_bool(bool b, span s) override {
        open("boolean", s);
        os_ << ",\"value\":" << (b ? "true" : "false") << "}";
    }

    void visit_number(const spanx::json::number& n, span s) override {
        open("number", s);
        os_ << ",\"raw\":\"" << escape_json(n.raw) << "\"";
        if (n.is_integer()) {
            os_ << ",\"integer\":" << *n.integer;
        }
        if (n.clamped) {
            os_ << ",\"clamped\":true";
        }
        os_ << "}";
    }

    void visit_string(const spanx::json::string& str, span s) override {
        open("string", s);
        os_ << ",\"value\":\"" << escape_json(str.decoded) << "\"}";
    }

    void visit_key(const spanned<spanx::json::string>& key) override {
        os_ << "{\"text\":\"" << escape_json(key->decoded) << "\",\"span\":" << span_json(key.span)
            << "}";
    }

    void visit_array(const spanx::json::array& elements, span s) override {
        open("array", s);
        os_ << ",\"elements\":[";
        bool first = true;
        for (const auto& e : elements) {
            if (!first) {
                os_ << ",";
            }
            first = false;
            visit_value(e);
        }
        os_ << "]}";
    }

    void visit_object(const spanx::json::object& members, span s) override {
        open("object", s);
        os_ << ",\"members\":[";
        bool first = true;
        for (const auto& m : members) {
            if (!first) {
                os_ << ",";
            }
            first = false;
            visit_member(m);
        }
        os_ << "]}";
    }

    void visit_member(const spanned<spanx::json::member>& m) override {
        os_ << "{\"span\":" << span_json(m.span) << ",\"key\":";
        visit_key(m->key);
        os_ << ",\"value\":";
        visit_value(m->value);
        os_ << "}";
    }

private:
    void open(std::string_view kind, span s) {
        os_ << "{\"kind\":\"" << kind << "\",\"span\":" << span_json(s);
    }

    std::ostringstream& os_;
};

} // namespace

std::string dump_request(const spanned<spanx::http::request>& req) {
    std::ostringstream os;
    os << "{\"message\":\"request\",\"span\":" << span_json(req.span);
    os << ",\"head\":" << span_json(req->head);
    os << ",\"method\":";
    write_text(os, req->method_text);
    os << ",\"target\":";
    write_text(os, req->target);
    os << ",\"version\":";
    write_text(os, req->version);
    os << ",\"headers\":";
    write_headers(os, req->headers);
    os << ",\"body\":";
    write_body(os, req->body);
    os << "}";
    return os.str();
}

std::string dump_response(const spanned<spanx::http::response>& res) {
    std::ostringstream os;
    os << "{\"message\":\"response\",\"span\":" << span_json(res.span);
    os << ",\"head\":" << span_json(res->head);
    os << ",\"version\":";
    write_text(os, res->version);
    os << ",\"status\":{\"code\":" << res->status.value
       << ",\"span\":" << span_json(res->status.span) << "}";
    os << ",\"reason\":";
    write_text(os, res->reason);
    os << ",\"headers\":";
    write_headers(os, res->headers);
    os << ",\"body\":";
    write_body(os, res->body);
    os << "}";
    return os.str();
}

std::string dump_json(const spanned<spanx::json::value>& root) {
    std::ostringstream os;
    tree_writer writer(os);
    writer.visit_value(root);
    return os.str();
}

} // namespace spanx_dump
