#pragma once

#include <boost/uuid/nil_generator.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_hash.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <compare>
#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>

namespace Ids
{
    /**
     * @brief A random uuid. Derived types (see DEFINE_ID_TYPE) keep ids of different things apart. A default
     * constructed derived id is the nil uuid and not valid.
     */
    class Id
    {
      public:
        std::string value() const
        {
            return boost::uuids::to_string(uuid_);
        }

        boost::uuids::uuid const& uuid() const noexcept
        {
            return uuid_;
        }

        bool isValid() const noexcept
        {
            return !uuid_.is_nil();
        }

        friend bool operator==(Id const& lhs, Id const& rhs) = default;
        friend std::strong_ordering operator<=>(Id const& lhs, Id const& rhs)
        {
            return lhs.uuid_ < rhs.uuid_   ? std::strong_ordering::less
                : rhs.uuid_ < lhs.uuid_ ? std::strong_ordering::greater
                                        : std::strong_ordering::equal;
        }

        friend std::ostream& operator<<(std::ostream& stream, Id const& id)
        {
            return stream << id.uuid_;
        }

      protected:
        explicit Id(boost::uuids::uuid uuid)
            : uuid_{uuid}
        {}

        static boost::uuids::uuid random()
        {
            // Not thread safe and expensive to seed.
            thread_local boost::uuids::random_generator generator{};
            return generator();
        }

        /// Text that is not a uuid gives the nil uuid.
        static boost::uuids::uuid parse(std::string const& text)
        {
            try
            {
                return boost::uuids::string_generator{}(text);
            }
            catch (std::runtime_error const&)
            {
                return boost::uuids::nil_uuid();
            }
        }

      private:
        boost::uuids::uuid uuid_;
    };

    struct IdHash
    {
        std::size_t operator()(Id const& id) const noexcept
        {
            return boost::uuids::hash_value(id.uuid());
        }
    };
}

#define DEFINE_ID_TYPE(name) \
    namespace Ids \
    { \
        class name : public Id \
        { \
          public: \
            name() \
                : Id{boost::uuids::nil_uuid()} \
            {} \
\
            friend name generate##name(); \
            friend name make##name(std::string const&); \
\
          private: \
            explicit name(boost::uuids::uuid uuid) \
                : Id{uuid} \
            {} \
        }; \
\
        inline name generate##name() \
        { \
            return name{name::random()}; \
        } \
\
        inline name make##name(std::string const& text) \
        { \
            return name{name::parse(text)}; \
        } \
    }
