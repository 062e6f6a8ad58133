#ifndef __FACTORY_HPP__
#define __FACTORY_HPP__

#include "exception.hpp"

namespace registry
{
    // Creates implementations of Interface by key. Implementations add themselves
    // at static initialization time with REGISTER, so a key is known as soon as
    // the translation unit defining it is linked in.
    template<class Interface>
    class Factory
    {
    public:
        typedef std::shared_ptr<Interface> InterfacePtr;
        typedef InterfacePtr (*CreateInterfaceFn)();

        template<class TImplementation>
        static InterfacePtr DefaultCreator() { return std::make_shared<TImplementation>(); }

        static Factory<Interface>& Get()
        {
            static Factory<Interface> factory;
            return factory;
        }

        // a fresh instance for every call; throws UnsupportedFormat for an unknown key
        InterfacePtr Create(const std::string& sKey) const
        {
            auto pCreator = m_mCreators.find(sKey);
            if(pCreator == m_mCreators.end())
                THROW(UnsupportedFormat, "No implementation registered for \"", sKey, "\"");
            return (*pCreator->second)();
        }

        std::vector<std::string> Keys() const
        {
            std::vector<std::string> aKeys;
            for(const auto& [sKey, pfCreator] : m_mCreators)
                aKeys.push_back(sKey);
            return aKeys;
        }

        void Register(const std::string& sKey, CreateInterfaceFn pfCreator)
        {
            if(!m_mCreators.emplace(sKey, pfCreator).second)
                THROW(std::logic_error, "Key \"", sKey, "\" registered twice");
        }

    private:
        std::map<std::string, CreateInterfaceFn> m_mCreators;
    };
}


#define CONCAT_(x,y) x##y
#define CONCAT(x,y) CONCAT_(x,y)

// Registers cls under name in factory while the program starts up
#define REGISTER(factory, name, cls)  \
namespace \
{ \
    static struct CONCAT(Registerer, __LINE__) \
    { \
        CONCAT(Registerer, __LINE__)() \
        { \
            factory::Get().Register(name, factory::DefaultCreator<cls>); \
        } \
    } \
    CONCAT(reg, __LINE__); \
}

#endif
