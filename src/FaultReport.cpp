//--------------------------------------------------------------
// Main Header 
//--------------------------------------------------------------
#include "FaultReport.hpp"
//--------------------------------------------------------------
// Standard cpp library
//--------------------------------------------------------------
#include <sstream>
//--------------------------------------------------------------
std::string FaultHush::FaultReport::to_string(void) const {
    //--------------------------
    std::ostringstream _stream;
    _stream << "thread '" << thread << "' faulted at '" << message << "', "
            << location.file_name() << ':' << location.line() << ':' << location.column();
    //--------------------------
    return _stream.str();
    //--------------------------
}// end std::string FaultHush::FaultReport::to_string(void) const
//--------------------------------------------------------------
