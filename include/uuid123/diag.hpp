#pragma once
#ifdef DIAG
#error DIAG is already defined.  Are you including some other diag header as well as uuid123/diag.hpp?
#endif

/*! \brief Diagnostic output for the uuid123 library.

  Basic Usage:

   #include <uuid123/diag.hpp>
   ...
   static auto _foo = uuid123::diag_name("foo");
   DIAG(_foo, "anything " << formatable << " using the stream insertion operator(<<)");

  The first argument can be any boolean expression.  DIAG is a macro,
  carefully constructed so that the second argument is *not
  evaluated* if the first is false.  So it's safe to leave DIAGs in
  the generators - when the name is off, a DIAG costs a load and a
  compare.

  diag_name returns a named_ref<int>.  It is interconvertible to and
  from plain int, so you can say:

    DIAG(_foo>1, "only if you're *very* interested in foo");

  Names are set with a colon-separated list of name[=value] pairs:

    uuid123::set_diag_names("uuid:random=2");

  or, equivalently, from the environment, before the program starts:

    export UUID123_DIAG_NAMES="uuid:random=2"

  The names used by the library itself are:

    uuid   - every generated uuid, and parse failures
    random - random source selection, seeding and swaps
    sha1   - sha1 input and output sizes
    md5    - md5 input and output sizes

  Library code should call diag_name at function scope (a
  function-scoped static), because library functions may be called
  during static initialization of some other translation unit.

  Where does the output go?
  -------------------------

     set_diag_destination(const std::string& dest, int mode=0666);

  or UUID123_DIAG_DESTINATION in the environment.  The special forms
  are:

     "%stderr" - file descriptor 2 (the default)
     "%stdout" - file descriptor 1
     "%none"   - discard
     ""        - same as "%none"

  Anything else is a file, opened O_WRONLY|O_APPEND|O_CREAT.  If the
  open fails, set_diag_destination throws a std::system_error.

  Formatting:
  -----------

  A colon-separated list of option names, each optionally prefixed
  with "no":

     set_diag_opts("tstamp:nowhy");

  or UUID123_DIAG_OPTS in the environment.  Options are:

     tstamp  - microsecond wall-clock timestamp
     func    - the name of the calling function (default on)
     why     - the stringified first argument (default on)
     newline - append a newline to every record (default on)
*/

#include <uuid123/str_view.hpp>
#include <map>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>

#ifdef __GNUC__
#define __uuid123_diag_unlikely(x) __builtin_expect(!!(x), 0)
#else
#define __uuid123_diag_unlikely(x) (x)
#endif

#define DIAGloc(BOOL, _file, _line, _func, _expr) do{                   \
        if( __uuid123_diag_unlikely(bool(BOOL)) ){                      \
            std::lock_guard<std::recursive_mutex> __diag_lg(uuid123::_diag_mtx()); \
            uuid123::_diag_before( #BOOL , _file, _line, _func) << _expr; \
            uuid123::_diag_after();                                     \
        }                                                               \
    }while(0)

#define DIAG(BOOL, expr)                        \
    DIAGloc(BOOL, __FILE__, __LINE__, __func__, expr)

namespace uuid123{

template <typename T>
struct named_ref_space;

// named_ref<T> - a reference to a T that lives in a named_ref_space.
// Nothing is ever erased from the space, so a named_ref never
// dangles.
template <typename T>
struct named_ref{
    named_ref() = delete;
    operator T&() { return *m_ptr; }
    operator const T&() const { return *m_ptr; }
    named_ref& operator=(const T& rhs){
        *m_ptr = rhs;
        return *this;
    }
private:
    friend struct named_ref_space<T>;
    explicit named_ref(T *p) : m_ptr(p){
        if(p == nullptr)
            throw std::logic_error("named_ref<T>:  null pointer");
    }
    T *m_ptr;
};

template <typename T>
struct named_ref_space{
    typedef std::map<std::string, T> named_ref_map_t;
    named_ref<T> declare(const std::string& name, const T& dflt = T{}){
        if(name.empty())
            throw std::invalid_argument("named_ref_space::declare(name):  name must be non-empty");
        std::lock_guard<std::mutex> lg(mtx);
        auto iter = themap.insert(std::make_pair(name, dflt)).first;
        return named_ref<T>(&iter->second);
    }
    // A const map, so that callers can't erase anything.
    const named_ref_map_t& getmap() const {
        return themap;
    }
private:
    std::mutex mtx;
    named_ref_map_t themap;
};

named_ref<int> diag_name(const std::string& name, int initial_value = 0);
void set_diag_names(const std::string& names, bool clear_before_set = true);
std::string get_diag_names(bool showall = false);

void set_diag_opts(const std::string& opts, bool restore_defaults_before_set = true);
std::string get_diag_opts();

void set_diag_destination(const std::string& dest, int mode = 0666);

// private - do not call.  They're only visible because the DIAG
// macro expands to calls to them.
std::recursive_mutex& _diag_mtx();
std::ostream& _diag_before(const char* k, const char *file, int line, const char *func);
void _diag_after();

} // namespace uuid123
