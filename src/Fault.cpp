//--------------------------------------------------------------
// Main Header 
//--------------------------------------------------------------
#include "Fault.hpp"
//--------------------------------------------------------------
// Standard cpp library
//--------------------------------------------------------------
#include <thread>
#include <utility>
//--------------------------------------------------------------
// User Defined Headers
//--------------------------------------------------------------
#include "FaultHook.hpp"
//--------------------------------------------------------------
FaultHush::Fault::Fault(FaultReport report) :   std::runtime_error(report.message),
                                                m_report(std::move(report)) {
    //--------------------------
}// end FaultHush::Fault::Fault(FaultReport report)
//--------------------------------------------------------------
void FaultHush::fault(std::string message, const std::source_location& location) {
    //--------------------------
    FaultReport _report(std::move(message), location, std::this_thread::get_id());
    //--------------------------
    FaultHook::instance().report(_report);
    //--------------------------
    throw Fault(std::move(_report));
    //--------------------------
}// end void FaultHush::fault(std::string message, const std::source_location& location)
//--------------------------------------------------------------
std::optional<FaultHush::FaultReport> FaultHush::catch_fault(const std::function<void(void)>& fn) {
    //--------------------------
    try {
        fn();
    } catch (const Fault& caught) {
        return caught.report();
    }// end try
    //--------------------------
    return std::nullopt;
    //--------------------------
}// end std::optional<FaultHush::FaultReport> FaultHush::catch_fault(const std::function<void(void)>& fn)
//--------------------------------------------------------------
