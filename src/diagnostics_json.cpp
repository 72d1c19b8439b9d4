#include "automat/diagnostics_json.hpp"
#include "automat/env.hpp"
#include <cstdio>

namespace automat {

namespace {

void put_escaped(std::string& out, const std::string& s){
    out += '"';
    for(unsigned char c : s){
        switch(c){
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if(c < 0x20){
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += '"';
}

// `"key":` with the separator for every key after the first.
void put_key(std::string& out, const char* key, bool first = false){
    if(!first) out += ',';
    out += '"';
    out += key;
    out += "\":";
}

void put_field(std::string& out, const char* key, const std::string& value, bool first = false){
    put_key(out, key, first);
    put_escaped(out, value);
}

void put_field(std::string& out, const char* key, int value){
    put_key(out, key);
    out += std::to_string(value);
}

// Notes without a position (line < 0) carry only their message.
void put_note(std::string& out, const Note& n){
    out += '{';
    put_field(out, "message", n.message, true);
    if(n.line >= 0){
        put_field(out, "line", n.line);
        put_field(out, "col", n.col);
    }
    out += '}';
}

} // namespace

std::string json_escape(const std::string& s){
    std::string out;
    out.reserve(s.size() + 2);
    put_escaped(out, s);
    return out;
}

std::string diagnostic_to_json(const Diagnostic& d){
    std::string out = "{";
    put_field(out, "stage", stage_name(d.stage), true);
    put_field(out, "code", d.code);
    put_field(out, "message", d.message);
    put_field(out, "hint", d.hint);
    put_field(out, "file", d.file);
    put_field(out, "line", d.line);
    put_field(out, "col", d.col);
    put_key(out, "notes");
    out += '[';
    for(size_t i = 0; i < d.notes.size(); ++i){
        if(i) out += ',';
        put_note(out, d.notes[i]);
    }
    out += "]}";
    return out;
}

std::string result_to_json(bool success, const std::optional<Diagnostic>& error){
    std::string out = "{\"success\":";
    out += success ? "true" : "false";
    out += ",\"errors\":[";
    if(error) out += diagnostic_to_json(*error);
    out += "]}";
    return out;
}

void maybe_print_json(const CompileEnv& env, bool success, const std::optional<Diagnostic>& error){
    if(!env.diagJson) return;
    std::fprintf(stderr, "%s\n", result_to_json(success, error).c_str());
}

} // namespace automat
