//--------------------------------------------------------------
// Main Header 
//--------------------------------------------------------------
#include "InterceptionHook.hpp"
//--------------------------------------------------------------
// Standard cpp library
//--------------------------------------------------------------
#include <iostream>
#include <system_error>
#include <thread>
//--------------------------------------------------------------
// User Defined Headers
//--------------------------------------------------------------
#include "FaultHook.hpp"
#include "HushRegistry.hpp"
//--------------------------------------------------------------
void FaultHush::detail::intercept_fault(const FaultReport& report) {
    //--------------------------
    const std::thread::id _thread_id = std::this_thread::get_id();
    //--------------------------
    // Installed but not yet published: another thread is inside the first
    // HushRegistry::instance() call and publishes before it stops installing.
    HushRegistry* _registry = HushRegistry::try_instance();
    while (!_registry and HushRegistry::installing()) {
        std::this_thread::yield();
        _registry = HushRegistry::try_instance();
    }// end while (!_registry and HushRegistry::installing())
    //--------------------------
    // installing() turns false only after the publish.
    if (!_registry) {
        _registry = HushRegistry::try_instance();
    }// end if (!_registry)
    //--------------------------
    if (!_registry) {
        FaultHook::default_reporter(report);
        return;
    }// end if (!_registry)
    //--------------------------
    bool _hushed = false;
    try {
        _hushed = _registry->contains(_thread_id);
    } catch (const std::system_error& error) {
        std::cerr << "hush lookup failed, reporting anyway: " << error.what() << std::endl;
    }// end try
    //--------------------------
    if (_hushed) {
        return;
    }// end if (_hushed)
    //--------------------------
    _registry->forward(report);
    //--------------------------
}// end void FaultHush::detail::intercept_fault(const FaultReport& report)
//--------------------------------------------------------------
