//--------------------------------------------------------------
// Main Header 
//--------------------------------------------------------------
#include "FaultHook.hpp"
//--------------------------------------------------------------
// Standard cpp library
//--------------------------------------------------------------
#include <exception>
#include <iostream>
#include <utility>
//--------------------------------------------------------------
// User Defined Headers
//--------------------------------------------------------------
#include "Fault.hpp"
//--------------------------------------------------------------
// Set while this thread is inside a reporter
static thread_local bool s_reporting = false;
//--------------------------------------------------------------
namespace {
    //--------------------------------------------------------------
    struct ReportingScope {
        ReportingScope(void)    { s_reporting = true; }
        ~ReportingScope(void)   { s_reporting = false; }
    };// end struct ReportingScope
    //--------------------------------------------------------------
}// end namespace
//--------------------------------------------------------------
FaultHush::FaultHook::FaultHook(void) : m_reporter(make_reporter(FaultReporter())) {
    //--------------------------
}// end FaultHush::FaultHook::FaultHook(void)
//--------------------------------------------------------------
FaultHush::FaultHook& FaultHush::FaultHook::instance(void) {
    //--------------------------
    static FaultHook instance;
    return instance;
    //--------------------------
}// end FaultHush::FaultHook::instance(void)
//--------------------------------------------------------------
FaultHush::FaultReporter FaultHush::FaultHook::hook(void) const {
    //--------------------------
    return *current_reporter();
    //--------------------------
}// end FaultHush::FaultHook::hook(void) const
//--------------------------------------------------------------
void FaultHush::FaultHook::set_hook(FaultReporter reporter) {
    //--------------------------
    static_cast<void>(exchange_reporter(std::move(reporter)));
    //--------------------------
}// end void FaultHush::FaultHook::set_hook(FaultReporter reporter)
//--------------------------------------------------------------
FaultHush::FaultReporter FaultHush::FaultHook::take_hook(void) {
    //--------------------------
    return exchange_reporter(FaultReporter());
    //--------------------------
}// end FaultHush::FaultHook::take_hook(void)
//--------------------------------------------------------------
FaultHush::FaultReporter FaultHush::FaultHook::exchange_hook(FaultReporter reporter) {
    //--------------------------
    return exchange_reporter(std::move(reporter));
    //--------------------------
}// end FaultHush::FaultHook::exchange_hook(FaultReporter reporter)
//--------------------------------------------------------------
void FaultHush::FaultHook::report(const FaultReport& report) const {
    //--------------------------
    report_data(report);
    //--------------------------
}// end void FaultHush::FaultHook::report(const FaultReport& report) const
//--------------------------------------------------------------
void FaultHush::FaultHook::default_reporter(const FaultReport& report) {
    //--------------------------
    std::cerr << report.to_string() << std::endl;
    //--------------------------
}// end void FaultHush::FaultHook::default_reporter(const FaultReport& report)
//--------------------------------------------------------------
FaultHush::FaultHook::ReporterPointer FaultHush::FaultHook::make_reporter(FaultReporter&& reporter) {
    //--------------------------
    if (!reporter) {
        return std::make_shared<const FaultReporter>(&FaultHook::default_reporter);
    }// end if (!reporter)
    //--------------------------
    return std::make_shared<const FaultReporter>(std::move(reporter));
    //--------------------------
}// end FaultHush::FaultHook::make_reporter(FaultReporter&& reporter)
//--------------------------------------------------------------
FaultHush::FaultReporter FaultHush::FaultHook::exchange_reporter(FaultReporter&& reporter) {
    //--------------------------
    ReporterPointer _replacement = make_reporter(std::move(reporter));
    ReporterPointer _retired;
    FaultReporter _previous;
    //--------------------------
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // Copy first: if it throws the slot is untouched.
        _previous = *m_reporter;
        _retired  = std::exchange(m_reporter, std::move(_replacement));
    }
    //--------------------------
    return _previous;
    //--------------------------
}// end FaultHush::FaultHook::exchange_reporter(FaultReporter&& reporter)
//--------------------------------------------------------------
FaultHush::FaultHook::ReporterPointer FaultHush::FaultHook::current_reporter(void) const {
    //--------------------------
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_reporter;
    //--------------------------
}// end FaultHush::FaultHook::current_reporter(void) const
//--------------------------------------------------------------
void FaultHush::FaultHook::report_data(const FaultReport& report) const {
    //--------------------------
    if (s_reporting) {
        std::cerr << "fault while reporting a fault: " << report.to_string() << std::endl;
        return;
    }// end if (s_reporting)
    //--------------------------
    const ReporterPointer _reporter = current_reporter();
    //--------------------------
    ReportingScope _scope;
    try {
        (*_reporter)(report);
    } catch (const Fault&) {
        // Raised inside the reporter; the nested report already wrote its line.
    } catch (const std::exception& error) {
        std::cerr << "fault reporter threw: " << error.what() << std::endl;
    }// end try
    //--------------------------
}// end void FaultHush::FaultHook::report_data(const FaultReport& report) const
//--------------------------------------------------------------
