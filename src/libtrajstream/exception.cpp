#include "pch.hpp"
#include "exception.hpp"

#ifdef __GNUG__
  #include <cxxabi.h>
#endif

using namespace std;

namespace
{
    string type_name_of(const exception& e)
    {
        const char* szMangled = typeid(e).name();
#ifdef __GNUG__
        int nStatus = 0;
        unique_ptr<char, void(*)(void*)> pName(abi::__cxa_demangle(szMangled, nullptr, nullptr, &nStatus), std::free);
        if(nStatus == 0 && pName)
            return pName.get();
#endif
        return szMangled;
    }

    // calls fn(e, depth) for e and every exception nested into it
    template<typename Fn>
    void for_each_nested(const exception& e, Fn fn, int nDepth = 0)
    {
        fn(e, nDepth);
        try
        {
            rethrow_if_nested(e);
        }
        catch(const exception& inner)
        {
            for_each_nested(inner, fn, nDepth + 1);
        }
        catch(...)
        {
            fn(runtime_error("non-standard exception"), nDepth + 1);
        }
    }
}

void print_nested_exception(std::ostream& os, const std::exception& e, int level)
{
    for_each_nested(e, [&](const exception& link, int nDepth)
    {
        os << string(2 * (level + nDepth + 1), ' ')
           << (nDepth == 0 ? "ERROR" : "caused by")
           << " [" << type_name_of(link) << "]: " << link.what() << '\n';
    });
}

void print_nested_exception(std::ostream& os, const std::exception_ptr& eptr)
{
    if(!eptr)
        return;

    try
    {
        rethrow_exception(eptr);
    }
    catch(const exception& e)
    {
        print_nested_exception(os, e);
    }
}

std::string describe_exception(const std::exception& e)
{
    string sDescription;
    for_each_nested(e, [&](const exception& link, int nDepth)
    {
        if(nDepth > 0)
            sDescription += ": ";
        sDescription += link.what();
    });
    return sDescription;
}
