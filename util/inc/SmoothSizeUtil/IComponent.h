#ifndef SMOOTHSIZEUTIL_ICOMPONENT
#define SMOOTHSIZEUTIL_ICOMPONENT

#include <memory>
#include <vector>

namespace SmoothSize {

    /// Base of every interface.
    class Interface {
      public:
        typedef std::shared_ptr<Interface> pointer;
        virtual ~Interface();
    };

    /** Interfaces derive from this with themselves as the template
     * argument to get the usual pointer types. */
    template <class Type>
    class IComponent : virtual public Interface {
      public:
        typedef std::shared_ptr<Type> pointer;
        typedef std::shared_ptr<const Type> const_pointer;
        typedef std::vector<pointer> vector;

        virtual ~IComponent() {}
    };

}  // namespace SmoothSize

#endif
