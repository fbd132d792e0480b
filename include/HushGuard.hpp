#pragma once
//--------------------------------------------------------------
// Standard C++ library
//--------------------------------------------------------------
#include <thread>
//--------------------------------------------------------------
// User Defined Headers
//--------------------------------------------------------------
#include "FaultHushAPI.hpp"
//--------------------------------------------------------------
namespace FaultHush {
    //--------------------------------------------------------------
    class HushGuard;
    //--------------------------
    FAULTHUSH_API HushGuard hush_this_test(void);
    //--------------------------------------------------------------
    // Unhushes the thread that created it when destroyed, on whichever
    // thread that happens. Obtain one from hush_this_test().
    //--------------------------------------------------------------
    class FAULTHUSH_API HushGuard {
        //--------------------------------------------------------------
        public:
            //--------------------------------------------------------------
            HushGuard(void) = default;
            //--------------------------
            HushGuard(HushGuard&& other) noexcept;
            HushGuard& operator=(HushGuard&& other) noexcept;
            //--------------------------
            HushGuard(const HushGuard&)             = delete;
            HushGuard& operator=(const HushGuard&)  = delete;
            //--------------------------
            ~HushGuard(void) noexcept;
            //--------------------------
            // Unhushes now. Returns whether the thread was still hushed.
            bool release(void) noexcept;
            //--------------------------
            std::thread::id thread_id(void) const noexcept {
                return m_thread_id;
            }// end std::thread::id thread_id(void) const noexcept
            //--------------------------
            explicit operator bool(void) const noexcept {
                return m_engaged;
            }// end explicit operator bool(void) const noexcept
            //--------------------------------------------------------------
        protected:
            //--------------------------------------------------------------
            explicit HushGuard(const std::thread::id& thread_id) noexcept;
            //--------------------------
            bool release_data(void) noexcept;
            //--------------------------
            friend HushGuard hush_this_test(void);
            //--------------------------------------------------------------
        private:
            //--------------------------------------------------------------
            std::thread::id m_thread_id;
            bool m_engaged{false};
            //--------------------------
            void move_from(HushGuard&& other) noexcept;
        //--------------------------------------------------------------
    };// end class HushGuard
    //--------------------------------------------------------------
}// end namespace FaultHush
//--------------------------------------------------------------
