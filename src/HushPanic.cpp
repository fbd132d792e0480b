//--------------------------------------------------------------
// Main Header 
//--------------------------------------------------------------
#include "HushPanic.hpp"
//--------------------------------------------------------------
// Standard cpp library
//--------------------------------------------------------------
#include <thread>
//--------------------------------------------------------------
// User Defined Headers
//--------------------------------------------------------------
#include "HushRegistry.hpp"
//--------------------------------------------------------------
void FaultHush::hush_panic(void) {
    //--------------------------
    static_cast<void>(HushRegistry::instance().insert(std::this_thread::get_id()));
    //--------------------------
}// end void FaultHush::hush_panic(void)
//--------------------------------------------------------------
bool FaultHush::unhush_panic(void) {
    //--------------------------
    return HushRegistry::instance().remove(std::this_thread::get_id());
    //--------------------------
}// end bool FaultHush::unhush_panic(void)
//--------------------------------------------------------------
bool FaultHush::is_panic_hushed(void) {
    //--------------------------
    const HushRegistry* _registry = HushRegistry::try_instance();
    //--------------------------
    return _registry and _registry->contains(std::this_thread::get_id());
    //--------------------------
}// end bool FaultHush::is_panic_hushed(void)
//--------------------------------------------------------------
FaultHush::HushGuard FaultHush::hush_this_test(void) {
    //--------------------------
    hush_panic();
    //--------------------------
    return HushGuard(std::this_thread::get_id());
    //--------------------------
}// end FaultHush::HushGuard FaultHush::hush_this_test(void)
//--------------------------------------------------------------
