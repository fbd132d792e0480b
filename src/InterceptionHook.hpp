#pragma once
//--------------------------------------------------------------
// User Defined Headers
//--------------------------------------------------------------
#include "FaultHushAPI.hpp"
#include "FaultReport.hpp"
//--------------------------------------------------------------
namespace FaultHush {
    //--------------------------------------------------------------
    namespace detail {
        //--------------------------------------------------------------
        // The reporter HushRegistry installs into FaultHook. Drops reports
        // raised on hushed threads and forwards everything else to the
        // reporter that was installed before it. Without a registry, and
        // with none being set up, reports go to FaultHook::default_reporter.
        FAULTHUSH_LOCAL void intercept_fault(const FaultReport& report);
        //--------------------------------------------------------------
    }// end namespace detail
    //--------------------------------------------------------------
}// end namespace FaultHush
//--------------------------------------------------------------
