#ifndef NLBD_ERROR_KIND_HPP
#define NLBD_ERROR_KIND_HPP

// Error taxonomy shared by every layer. Carried in result structs next to the
// human-readable detail and reported to the client as "error_kind".

namespace nlbd {

enum class ErrorKind {
    None,
    Transport,  // channel unreachable / broken / malformed frame
    Parse,      // no rule matched / missing argument
    Registry,   // tab not found / no active tab
    Driver,     // page operation failed
    Timeout,    // bounded wait expired
    Lifecycle   // already running / not running
};

inline const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:      return "none";
    case ErrorKind::Transport: return "transport";
    case ErrorKind::Parse:     return "parse";
    case ErrorKind::Registry:  return "registry";
    case ErrorKind::Driver:    return "driver";
    case ErrorKind::Timeout:   return "timeout";
    case ErrorKind::Lifecycle: return "lifecycle";
    }
    return "none";
}

} // namespace nlbd

#endif // NLBD_ERROR_KIND_HPP
