#pragma once
//--------------------------------------------------------------
// Standard C++ library
//--------------------------------------------------------------
#include <functional>
#include <source_location>
#include <string>
#include <thread>
#include <utility>
//--------------------------------------------------------------
// User Defined Headers
//--------------------------------------------------------------
#include "FaultHushAPI.hpp"
//--------------------------------------------------------------
namespace FaultHush {
    //--------------------------------------------------------------
    // Everything a reporter gets to see about one fault.
    //--------------------------------------------------------------
    struct FAULTHUSH_API FaultReport {
        //--------------------------------------------------------------
        FaultReport(void) = default;
        //--------------------------
        FaultReport(std::string message_,
                    const std::source_location& location_,
                    const std::thread::id& thread_) :   message(std::move(message_)),
                                                        location(location_),
                                                        thread(thread_) {
            //--------------------------
        }// end FaultReport(std::string, const std::source_location&, const std::thread::id&)
        //--------------------------
        // thread '<id>' faulted at '<message>', <file>:<line>:<column>
        std::string to_string(void) const;
        //--------------------------
        std::string message;
        std::source_location location;
        std::thread::id thread;
        //--------------------------------------------------------------
    };// end struct FaultReport
    //--------------------------------------------------------------
    using FaultReporter = std::function<void(const FaultReport&)>;
    //--------------------------------------------------------------
}// end namespace FaultHush
//--------------------------------------------------------------
