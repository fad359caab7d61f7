#pragma once

// C++11 supports "nested" exceptions.  Throwing and annotating them
// is easy:
//
//      catch(std::exception& e){
//         std::throw_with_nested( std::runtime_error("more information") );
//      }
//
// Unpacking them is a bit tricky.  exnest_whats returns the what()
// strings of every level, from the outermost annotation to the
// innermost original exception:
//
//    catch(std::exception& e){
//       for(auto& w : exnest_whats(e))
//          std::cout << w << "\n";
//    }
//
// The easiest way to dispose of a nested exception is to 'complain'
// about it (see complaints.hpp), which does exactly that.

#include <exception>
#include <string>
#include <vector>

namespace dcore{

inline void _exnest_collect(const std::exception& e, std::vector<std::string>& out){
    out.emplace_back(e.what());
    try{
        std::rethrow_if_nested(e);
    }catch(std::exception& inner){
        _exnest_collect(inner, out);
    }catch(...){
        out.emplace_back("<nested exception not derived from std::exception>");
    }
}

inline std::vector<std::string> exnest_whats(const std::exception& e){
    std::vector<std::string> ret;
    _exnest_collect(e, ret);
    return ret;
}

} // namespace dcore
