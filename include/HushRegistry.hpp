#pragma once
//--------------------------------------------------------------
// Standard cpp library
//--------------------------------------------------------------
#include <atomic>
#include <cstddef>
#include <mutex>
#include <thread>
#include <unordered_set>
//--------------------------------------------------------------
// User Defined Headers
//--------------------------------------------------------------
#include "FaultHushAPI.hpp"
#include "FaultReport.hpp"
//--------------------------------------------------------------
namespace FaultHush {
    //--------------------------------------------------------------
    // Set of hushed thread ids plus the reporter that was installed before
    // the interception hook took over. Created once by instance(), never
    // destroyed.
    //--------------------------------------------------------------
    class FAULTHUSH_API HushRegistry {
        //--------------------------------------------------------------
        public:
            //--------------------------------------------------------------
            // First call installs the interception hook into FaultHook.
            static HushRegistry& instance(void);
            //--------------------------
            // nullptr until instance() has finished on some thread.
            static HushRegistry* try_instance(void);
            //--------------------------
            // True only while the first instance() call is installing the hook.
            static bool installing(void);
            //--------------------------
            // Whether reporter is the interception hook.
            static bool is_interceptor(const FaultReporter& reporter);
            //--------------------------
            bool insert(const std::thread::id& thread_id);
            //--------------------------
            bool remove(const std::thread::id& thread_id);
            //--------------------------
            bool contains(const std::thread::id& thread_id) const;
            //--------------------------
            size_t size(void) const;
            //--------------------------
            // Empty original (the hook replaced itself) goes to FaultHook::default_reporter.
            void forward(const FaultReport& report) const;
            //--------------------------------------------------------------
        protected:
            //--------------------------------------------------------------
            HushRegistry(void) = default;
            ~HushRegistry(void) = default;
            //--------------------------
            static void initialize(void);
            //--------------------------
            bool insert_thread(const std::thread::id& thread_id);
            //--------------------------
            bool remove_thread(const std::thread::id& thread_id);
            //--------------------------
            bool is_hushed(const std::thread::id& thread_id) const;
            //--------------------------------------------------------------
        private:
            //--------------------------------------------------------------
            HushRegistry(const HushRegistry&)               = delete;
            HushRegistry& operator=(const HushRegistry&)    = delete;
            HushRegistry(HushRegistry&&)                    = delete;
            HushRegistry& operator=(HushRegistry&&)         = delete;
            //--------------------------
            // Written once in initialize() before the registry is published.
            FaultReporter m_original;
            mutable std::mutex m_mutex;
            std::unordered_set<std::thread::id> m_thread_table;
            //--------------------------
            static std::once_flag s_once;
            static std::atomic<HushRegistry*> s_instance;
            static std::atomic<bool> s_installing;
        //--------------------------------------------------------------
    };// end class HushRegistry
    //--------------------------------------------------------------
}// end namespace FaultHush
//--------------------------------------------------------------
