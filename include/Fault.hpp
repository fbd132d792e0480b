#pragma once
//--------------------------------------------------------------
// Standard C++ library
//--------------------------------------------------------------
#include <functional>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
//--------------------------------------------------------------
// User Defined Headers
//--------------------------------------------------------------
#include "FaultHushAPI.hpp"
#include "FaultReport.hpp"
//--------------------------------------------------------------
namespace FaultHush {
    //--------------------------------------------------------------
    // Thrown by fault() after the report went through FaultHook.
    //--------------------------------------------------------------
    class FAULTHUSH_API Fault : public std::runtime_error {
        //--------------------------------------------------------------
        public:
            //--------------------------------------------------------------
            explicit Fault(FaultReport report);
            //--------------------------
            const FaultReport& report(void) const noexcept {
                return m_report;
            }// end const FaultReport& report(void) const noexcept
            //--------------------------------------------------------------
        private:
            //--------------------------------------------------------------
            FaultReport m_report;
        //--------------------------------------------------------------
    };// end class Fault
    //--------------------------------------------------------------
    // Reports the fault for the calling thread, then throws Fault.
    [[noreturn]] FAULTHUSH_API void fault(std::string message,
                                          const std::source_location& location = std::source_location::current());
    //--------------------------
    // Runs fn. Returns the report of the Fault it raised, std::nullopt if it
    // returned normally. Other exceptions propagate.
    FAULTHUSH_API std::optional<FaultReport> catch_fault(const std::function<void(void)>& fn);
    //--------------------------------------------------------------
}// end namespace FaultHush
//--------------------------------------------------------------
