#ifndef GUNGAMESERVER_GLOBALS_HPP
#define GUNGAMESERVER_GLOBALS_HPP
#ifdef GGS_INCLUDE_INTERNAL
#include <replxx.hxx>
#endif

namespace ggs {
#ifdef GGS_INCLUDE_INTERNAL
    extern replxx::Replxx replxx_instance;
#endif
}

#endif //GUNGAMESERVER_GLOBALS_HPP
