//--------------------------------------------------------------
// Main Header 
//--------------------------------------------------------------
#include "HushGuard.hpp"
//--------------------------------------------------------------
// Standard cpp library
//--------------------------------------------------------------
#include <iostream>
#include <system_error>
#include <utility>
//--------------------------------------------------------------
// User Defined Headers
//--------------------------------------------------------------
#include "HushRegistry.hpp"
//--------------------------------------------------------------
FaultHush::HushGuard::HushGuard(const std::thread::id& thread_id) noexcept :    m_thread_id(thread_id),
                                                                                m_engaged(true) {
    //--------------------------
}// end FaultHush::HushGuard::HushGuard(const std::thread::id& thread_id)
//--------------------------------------------------------------
FaultHush::HushGuard::HushGuard(HushGuard&& other) noexcept {
    //--------------------------
    move_from(std::move(other));
    //--------------------------
}// end FaultHush::HushGuard::HushGuard(HushGuard&& other)
//--------------------------------------------------------------
FaultHush::HushGuard& FaultHush::HushGuard::operator=(HushGuard&& other) noexcept {
    //--------------------------
    if (this != &other) {
        static_cast<void>(release_data());
        move_from(std::move(other));
    }// end if (this != &other)
    //--------------------------
    return *this;
    //--------------------------
}// end FaultHush::HushGuard::operator=(HushGuard&& other)
//--------------------------------------------------------------
FaultHush::HushGuard::~HushGuard(void) noexcept {
    //--------------------------
    static_cast<void>(release_data());
    //--------------------------
}// end FaultHush::HushGuard::~HushGuard(void)
//--------------------------------------------------------------
bool FaultHush::HushGuard::release(void) noexcept {
    //--------------------------
    return release_data();
    //--------------------------
}// end bool FaultHush::HushGuard::release(void)
//--------------------------------------------------------------
bool FaultHush::HushGuard::release_data(void) noexcept {
    //--------------------------
    if (!m_engaged) {
        return false;
    }// end if (!m_engaged)
    //--------------------------
    m_engaged = false;
    //--------------------------
    // An engaged guard implies the registry exists, see hush_this_test().
    HushRegistry* _registry = HushRegistry::try_instance();
    if (!_registry) {
        return false;
    }// end if (!_registry)
    //--------------------------
    try {
        return _registry->remove(m_thread_id);
    } catch (const std::system_error& error) {
        std::cerr << "Failed to unhush thread " << m_thread_id << ": " << error.what() << std::endl;
    }// end try
    //--------------------------
    return false;
    //--------------------------
}// end bool FaultHush::HushGuard::release_data(void)
//--------------------------------------------------------------
void FaultHush::HushGuard::move_from(HushGuard&& other) noexcept {
    //--------------------------
    m_thread_id         = other.m_thread_id;
    m_engaged           = other.m_engaged;
    other.m_thread_id   = std::thread::id();
    other.m_engaged     = false;
    //--------------------------
}// end void FaultHush::HushGuard::move_from(HushGuard&& other)
//--------------------------------------------------------------
