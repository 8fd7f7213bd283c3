#pragma once

#ifdef _MSC_VER
    #define TOPO_FORCEINLINE __forceinline
#elif defined(__clang__) || defined(__GNUC__)
    #define TOPO_FORCEINLINE inline __attribute__((always_inline))
#else
    #define TOPO_FORCEINLINE inline
#endif
