#include "tagc/diagnostics_json.hpp"
#include <sstream>
#include <cstdlib>
#include <cstdio>

namespace tagc {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else o<<c;
                break;
        }
    }
    o<<'"';
    return o.str();
}

namespace {
// TypeError and TypeWarning share their shape
template<class D> void append_diag(std::ostringstream& os, const D& d){
    os<<"{\"code\":"<<json_escape(d.code)<<",\"message\":"<<json_escape(d.message)<<",\"hint\":"<<json_escape(d.hint)
      <<",\"line\":"<<d.line<<",\"col\":"<<d.col<<",\"notes\":[";
    for(size_t i=0;i<d.notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(d.notes[i].message)<<",\"line\":"<<d.notes[i].line<<",\"col\":"<<d.notes[i].col<<"}";
    }
    os<<"]}";
}
template<class D> void append_text(std::ostringstream& os, const D& d, const char* severity, const std::string& file){
    os<<file<<":"<<d.line<<":"<<d.col<<": "<<severity<<"["<<d.code<<"]: "<<d.message<<"\n";
    for(auto &n: d.notes) os<<"    note: "<<n.message<<"\n";
    if(!d.hint.empty()) os<<"    hint: "<<d.hint<<"\n";
}
} // namespace

std::string diagnostics_to_json(const TypeCheckResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.success?"true":"false")<<",\"errors\":[";
    for(size_t i=0;i<r.errors.size(); ++i){ if(i) os<<","; append_diag(os,r.errors[i]); }
    os<<"],\"warnings\":[";
    for(size_t i=0;i<r.warnings.size(); ++i){ if(i) os<<","; append_diag(os,r.warnings[i]); }
    os<<"]}";
    return os.str();
}

std::string format_diagnostics(const TypeCheckResult& r, const std::string& file){
    std::ostringstream os;
    for(auto &e: r.errors) append_text(os,e,"error",file);
    for(auto &w: r.warnings) append_text(os,w,"warning",file);
    return os.str();
}

void maybe_print_json(const TypeCheckResult& r){
    if(const char* env = std::getenv("TAGC_DIAG_JSON"); env && env[0]=='1'){
        auto js=diagnostics_to_json(r);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

} // namespace tagc
