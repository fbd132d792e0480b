#pragma once
//--------------------------------------------------------------
// Standard cpp library
//--------------------------------------------------------------
#include <memory>
#include <mutex>
//--------------------------------------------------------------
// User Defined Headers
//--------------------------------------------------------------
#include "FaultHushAPI.hpp"
#include "FaultReport.hpp"
//--------------------------------------------------------------
namespace FaultHush {
    //--------------------------------------------------------------
    // Process-wide fault reporting slot. Exactly one reporter is installed
    // at any time; it starts out as default_reporter. The slot lock is never
    // held while a reporter runs.
    //--------------------------------------------------------------
    class FAULTHUSH_API FaultHook {
        //--------------------------------------------------------------
        public:
            //--------------------------------------------------------------
            static FaultHook& instance(void);
            //--------------------------
            FaultReporter hook(void) const;
            //--------------------------
            // An empty reporter installs default_reporter.
            void set_hook(FaultReporter reporter);
            //--------------------------
            FaultReporter take_hook(void);
            //--------------------------
            // Installs the reporter and returns the one it replaced, under one lock.
            FaultReporter exchange_hook(FaultReporter reporter);
            //--------------------------
            void report(const FaultReport& report) const;
            //--------------------------
            static void default_reporter(const FaultReport& report);
            //--------------------------------------------------------------
        protected:
            //--------------------------------------------------------------
            FaultHook(void);
            ~FaultHook(void) = default;
            //--------------------------
            using ReporterPointer = std::shared_ptr<const FaultReporter>;
            //--------------------------
            static ReporterPointer make_reporter(FaultReporter&& reporter);
            //--------------------------
            FaultReporter exchange_reporter(FaultReporter&& reporter);
            //--------------------------
            ReporterPointer current_reporter(void) const;
            //--------------------------
            void report_data(const FaultReport& report) const;
            //--------------------------------------------------------------
        private:
            //--------------------------------------------------------------
            FaultHook(const FaultHook&)               = delete;
            FaultHook& operator=(const FaultHook&)    = delete;
            FaultHook(FaultHook&&)                    = delete;
            FaultHook& operator=(FaultHook&&)         = delete;
            //--------------------------
            mutable std::mutex m_mutex;
            ReporterPointer m_reporter;
        //--------------------------------------------------------------
    };// end class FaultHook
    //--------------------------------------------------------------
}// end namespace FaultHush
//--------------------------------------------------------------
