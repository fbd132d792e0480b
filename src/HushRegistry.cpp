//--------------------------------------------------------------
// Main Header 
//--------------------------------------------------------------
#include "HushRegistry.hpp"
//--------------------------------------------------------------
// Standard cpp library
//--------------------------------------------------------------
#include <memory>
#include <utility>
//--------------------------------------------------------------
// User Defined Headers
//--------------------------------------------------------------
#include "FaultHook.hpp"
#include "InterceptionHook.hpp"
//--------------------------------------------------------------
namespace {
    //--------------------------------------------------------------
    using ReporterFunction = void (*)(const FaultHush::FaultReport&);
    //--------------------------------------------------------------
}// end namespace
//--------------------------------------------------------------
// Initialize Static Variables
//--------------------------------------------------------------
std::once_flag FaultHush::HushRegistry::s_once;
std::atomic<FaultHush::HushRegistry*> FaultHush::HushRegistry::s_instance{nullptr};
std::atomic<bool> FaultHush::HushRegistry::s_installing{false};
//--------------------------------------------------------------
FaultHush::HushRegistry& FaultHush::HushRegistry::instance(void) {
    //--------------------------
    std::call_once(s_once, &HushRegistry::initialize);
    return *s_instance.load(std::memory_order_acquire);
    //--------------------------
}// end FaultHush::HushRegistry::instance(void)
//--------------------------------------------------------------
FaultHush::HushRegistry* FaultHush::HushRegistry::try_instance(void) {
    //--------------------------
    return s_instance.load(std::memory_order_acquire);
    //--------------------------
}// end FaultHush::HushRegistry::try_instance(void)
//--------------------------------------------------------------
bool FaultHush::HushRegistry::installing(void) {
    //--------------------------
    return s_installing.load(std::memory_order_acquire);
    //--------------------------
}// end bool FaultHush::HushRegistry::installing(void)
//--------------------------------------------------------------
bool FaultHush::HushRegistry::is_interceptor(const FaultReporter& reporter) {
    //--------------------------
    const ReporterFunction* _target = reporter.target<ReporterFunction>();
    //--------------------------
    return _target and *_target == &detail::intercept_fault;
    //--------------------------
}// end bool FaultHush::HushRegistry::is_interceptor(const FaultReporter& reporter)
//--------------------------------------------------------------
bool FaultHush::HushRegistry::insert(const std::thread::id& thread_id) {
    //--------------------------
    return insert_thread(thread_id);
    //--------------------------
}// end bool FaultHush::HushRegistry::insert(const std::thread::id& thread_id)
//--------------------------------------------------------------
bool FaultHush::HushRegistry::remove(const std::thread::id& thread_id) {
    //--------------------------
    return remove_thread(thread_id);
    //--------------------------
}// end bool FaultHush::HushRegistry::remove(const std::thread::id& thread_id)
//--------------------------------------------------------------
bool FaultHush::HushRegistry::contains(const std::thread::id& thread_id) const {
    //--------------------------
    return is_hushed(thread_id);
    //--------------------------
}// end bool FaultHush::HushRegistry::contains(const std::thread::id& thread_id) const
//--------------------------------------------------------------
size_t FaultHush::HushRegistry::size(void) const {
    //--------------------------
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_thread_table.size();
    //--------------------------
}// end size_t FaultHush::HushRegistry::size(void) const
//--------------------------------------------------------------
void FaultHush::HushRegistry::forward(const FaultReport& report) const {
    //--------------------------
    if (!m_original) {
        FaultHook::default_reporter(report);
        return;
    }// end if (!m_original)
    //--------------------------
    m_original(report);
    //--------------------------
}// end void FaultHush::HushRegistry::forward(const FaultReport& report) const
//--------------------------------------------------------------
void FaultHush::HushRegistry::initialize(void) {
    //--------------------------
    // Everything that can throw happens before the hook goes in.
    std::unique_ptr<HushRegistry, void (*)(HushRegistry*)> _registry(new HushRegistry(),
                                                                     [](HushRegistry* registry) { delete registry; });
    //--------------------------
    struct InstallingScope {
        InstallingScope(void)   { s_installing.store(true, std::memory_order_release); }
        ~InstallingScope(void)  { s_installing.store(false, std::memory_order_release); }
    } _installing;
    //--------------------------
    // From here on faults on other threads wait in the hook until the
    // registry is published below.
    FaultReporter _original = FaultHook::instance().exchange_hook(&detail::intercept_fault);
    //--------------------------
    if (is_interceptor(_original)) {
        _original = nullptr;
    }// end if (is_interceptor(_original))
    //--------------------------
    _registry->m_original.swap(_original);
    s_instance.store(_registry.release(), std::memory_order_release);
    //--------------------------
}// end void FaultHush::HushRegistry::initialize(void)
//--------------------------------------------------------------
bool FaultHush::HushRegistry::insert_thread(const std::thread::id& thread_id) {
    //--------------------------
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_thread_table.insert(thread_id).second;
    //--------------------------
}// end bool FaultHush::HushRegistry::insert_thread(const std::thread::id& thread_id)
//--------------------------------------------------------------
bool FaultHush::HushRegistry::remove_thread(const std::thread::id& thread_id) {
    //--------------------------
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_thread_table.erase(thread_id) > 0;
    //--------------------------
}// end bool FaultHush::HushRegistry::remove_thread(const std::thread::id& thread_id)
//--------------------------------------------------------------
bool FaultHush::HushRegistry::is_hushed(const std::thread::id& thread_id) const {
    //--------------------------
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_thread_table.contains(thread_id);
    //--------------------------
}// end bool FaultHush::HushRegistry::is_hushed(const std::thread::id& thread_id) const
//--------------------------------------------------------------
