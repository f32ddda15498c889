// Always-on checks, reporting the failing location.
#define unreachable  unreachable(__FILE__, __LINE__, static_cast<char const*>(__func__))
#define assert(expr) assert(!!(expr), #expr, __FILE__, __LINE__, static_cast<char const*>(__func__))
