#pragma once
//--------------------------------------------------------------
// User Defined Headers
//--------------------------------------------------------------
#include "FaultHushAPI.hpp"
#include "HushGuard.hpp"
//--------------------------------------------------------------
namespace FaultHush {
    //--------------------------------------------------------------
    // Faults raised on the calling thread stop being reported. Calling it
    // again before unhush_panic() changes nothing.
    FAULTHUSH_API void hush_panic(void);
    //--------------------------
    // Returns whether the calling thread was hushed.
    FAULTHUSH_API bool unhush_panic(void);
    //--------------------------
    FAULTHUSH_API bool is_panic_hushed(void);
    //--------------------------
    // hush_panic() for the rest of the caller's scope:
    //
    //     auto _hush = FaultHush::hush_this_test();
    //     FaultHush::fault("expected");   // nothing printed
    FAULTHUSH_API HushGuard hush_this_test(void);
    //--------------------------------------------------------------
}// end namespace FaultHush
//--------------------------------------------------------------
