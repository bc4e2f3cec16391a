#include "uuid123/diag.hpp"
#include "uuid123/throwutils.hpp"
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <fcntl.h>
#include <unistd.h>
using namespace std;

namespace {

// The names() function-scoped static is new'ed and never deleted.
// This leaks!  Yes.  It neatly avoids the static destructor fiasco
// when a DIAG runs in some other object's destructor.
uuid123::named_ref_space<int>& names(){
    static auto thenames = new uuid123::named_ref_space<int>;
    return *thenames;
}

struct diag_opts_t{
    bool tstamp;
    bool func;
    bool why;
    bool newline;
};
diag_opts_t opts;

void set_opt_defaults(){
    opts.tstamp = false;
    opts.func = true;
    opts.why = true;
    opts.newline = true;
}

// streams...  Ugh.  A stringbuf that lets us get at what's been
// written without copying, and start over without reallocating.
struct fancy_stringbuf : public std::stringbuf{
    fancy_stringbuf() : std::stringbuf(std::ios_base::out) {}
    uuid123::str_view sv(){
        return {pbase(), size_t(pptr()-pbase())};
    }
    void reset(){
        setp(pbase(), epptr());
    }
};
fancy_stringbuf ostringbuf;
std::ostream os(&ostringbuf);

// the destination.  -1 means "discard".
int diag_fd = 2;
bool diag_fd_owned = false;

void clear_names(){
    // getmap returns a const map, so we jump through the declare hoop
    // to get something assignable.
    for(auto& kv : names().getmap())
        (int&)names().declare(kv.first) = 0;
}

// Read the UUID123_DIAG_* variables, once, at static-initialization
// time.  Errors are reported and otherwise ignored:  a bad diag
// setting should not keep a program from starting.
struct env_initializer{
    env_initializer() try {
        set_opt_defaults();
        const char *p;
        uuid123::set_diag_names( (p=::getenv("UUID123_DIAG_NAMES")) ? p : "");
        uuid123::set_diag_opts( (p=::getenv("UUID123_DIAG_OPTS")) ? p : "");
        uuid123::set_diag_destination( (p=::getenv("UUID123_DIAG_DESTINATION")) ? p : "%stderr");
    }catch(std::exception &e){
        std::cerr << "WARNING: an error was encountered initializing uuid123 diagnostics from environment variables: " << e.what() << std::endl;
    }
};
env_initializer _at_startup_;

} // namespace <anon>

namespace uuid123{

std::recursive_mutex& _diag_mtx(){
    static auto mtx = new std::recursive_mutex;
    return *mtx;
}

named_ref<int> diag_name(const std::string& name, int initial_value){
    return names().declare(name, initial_value);
}

// str is expected to be a colon-separated list of key[=decimal_value]
// tokens, each of which sets the diagnostic level of 'key' to the
// given decimal value (1 if the value is unspecified).
void set_diag_names(const std::string& str, bool clear_before_set){
    if(clear_before_set)
        clear_names();
    string::size_type start, colon;
    colon = string::npos;
    do{
        start = colon+1;
        colon = str.find(':', start);
        string tok = str.substr(start, colon-start);
        if(tok.empty())
            continue;
        string skey;
        int lev = 1;
        auto idx = tok.find('=');
        if(idx != string::npos){
            skey = tok.substr(0, idx);
            // If there's a parse error?  Leave lev=1
            sscanf(tok.substr(idx+1).c_str(), "%d", &lev);
        }else{
            skey = tok;
        }
        if(!skey.empty())
            (int&)names().declare(skey) = lev;
    }while( colon != string::npos );
}

// get_diag_names:  the "inverse" of set_diag_names.  The string
// returned can be fed back into set_diag_names.
std::string get_diag_names(bool showall){
    const char *sep = "";
    std::ostringstream oss;
    for(const auto& kv : names().getmap()){
        if(showall || kv.second != 0){
            oss << sep << kv.first << "=" << kv.second;
            sep = ":";
        }
    }
    return oss.str();
}

void set_diag_opts(const std::string& s, bool restore_defaults_before_set){
    std::lock_guard<std::recursive_mutex> lk(_diag_mtx());
    if(restore_defaults_before_set)
        set_opt_defaults();
    string::size_type start, colon;
    colon = string::npos;
    do{
        start = colon + 1;
        colon = s.find(':', start);
        string tok = s.substr(start, colon-start);
        bool negate = tok.compare(0, 2, "no") == 0;
        if(negate)
            tok = tok.substr(2);
        if(tok == "tstamp")
            opts.tstamp = !negate;
        else if(tok == "func")
            opts.func = !negate;
        else if(tok == "why")
            opts.why = !negate;
        else if(tok == "newline")
            opts.newline = !negate;
    }while( colon != string::npos );
}

std::string get_diag_opts(){
    std::ostringstream oss;
    const char *sep = "";
#define FOO(opt)                       \
    oss << sep;                        \
    if(!opts.opt) oss << "no";         \
    oss << #opt;                       \
    sep = ":"
    FOO(tstamp);
    FOO(func);
    FOO(why);
    FOO(newline);
#undef FOO
    return oss.str();
}

void set_diag_destination(const std::string& dest, int mode){
    std::lock_guard<std::recursive_mutex> lk(_diag_mtx());
    int newfd;
    bool owned = false;
    if(dest.empty() || dest == "%none")
        newfd = -1;
    else if(dest == "%stderr")
        newfd = 2;
    else if(dest == "%stdout")
        newfd = 1;
    else{
        newfd = ::open(dest.c_str(), O_WRONLY|O_APPEND|O_CREAT|O_CLOEXEC, mode);
        if(newfd < 0)
            throw se(strfunargs("set_diag_destination", dest));
        owned = true;
    }
    if(diag_fd_owned)
        ::close(diag_fd);
    diag_fd = newfd;
    diag_fd_owned = owned;
}

std::ostream& _diag_before(const char* k, const char * /*file*/, int /*line*/, const char *func){
    if(opts.tstamp){
        using namespace std::chrono;
        // duration_cast always rounds toward zero.
        auto now_musec = duration_cast<microseconds>( system_clock::now().time_since_epoch() ).count();
        time_t now_timet = now_musec/1000000;
        auto musec = now_musec%1000000;
        struct tm now_tm;
        if(::localtime_r(&now_timet, &now_tm)){
            auto oldfill = os.fill('0');
            // E.g., "19:09:51.779321 "
            os << std::setw(2) << now_tm.tm_hour << ':' << std::setw(2) << now_tm.tm_min << ':' << std::setw(2) << now_tm.tm_sec << '.' << std::setw(6) << musec << ' ';
            os.fill(oldfill);
        }
    }
    if(opts.func)
        os << func << "() ";
    if(opts.why)
        os << "[" << k << "] ";
    return os;
}

void _diag_after(){
    if(opts.newline)
        ostringbuf.sputc('\n');
    auto sv = ostringbuf.sv();
    const char *p = sv.data();
    size_t left = sv.size();
    // A failed write to the diag destination has nowhere better to
    // be reported.  Drop the record.
    while(diag_fd >= 0 && left > 0){
        auto n = ::write(diag_fd, p, left);
        if(n <= 0)
            break;
        p += n;
        left -= size_t(n);
    }
    ostringbuf.reset();
}

} // namespace uuid123
