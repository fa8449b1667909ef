#pragma once

#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <cppinject/Container.hpp>

namespace fixtures
{

// Number of constructions per implementation, reset by every test fixture
inline std::map<std::string, int>& creations()
{
    static std::map<std::string, int> counts;
    return counts;
}

inline int created(const std::string& implementation)
{
    auto iter = creations().find(implementation);
    return iter == creations().end() ? 0 : iter->second;
}

inline std::shared_ptr<spdlog::logger> quietLogger()
{
    return std::make_shared<spdlog::logger>("quiet", std::make_shared<spdlog::sinks::null_sink_mt>());
}

inline cppinject::ContainerOptions quietOptions(
    cppinject::DuplicatePolicy policy = cppinject::DuplicatePolicy::Overwrite)
{
    cppinject::ContainerOptions options;
    options.duplicatePolicy = policy;
    options.logger = quietLogger();
    return options;
}

//----------------------------------------------------------------------------------------------------------------------
// Repository / email / user service

class Repository
{
public:
    virtual ~Repository()
    {
    }

    virtual std::string findById(long id) const = 0;
};

class Emailer
{
public:
    virtual ~Emailer()
    {
    }

    virtual std::string welcome(const std::string& user) = 0;
};

class UserService
{
public:
    virtual ~UserService()
    {
    }

    virtual std::string createUser(const std::string& name) = 0;
    virtual std::shared_ptr<Repository> repository() const = 0;
    virtual std::shared_ptr<Emailer> emailer() const = 0;
};

class Repo : public Repository
{
public:
    Repo()
    {
        ++creations()["Repo"];
    }

    std::string findById(long id) const override
    {
        return "user-" + std::to_string(id);
    }
};

class OtherRepo : public Repository
{
public:
    OtherRepo()
    {
        ++creations()["OtherRepo"];
    }

    std::string findById(long id) const override
    {
        return "other-" + std::to_string(id);
    }
};

class Email : public Emailer
{
public:
    Email()
    {
        ++creations()["Email"];
    }

    std::string welcome(const std::string& user) override
    {
        return "welcome " + user;
    }
};

class UserSvc : public UserService
{
public:
    UserSvc(std::shared_ptr<Repository> repository, std::shared_ptr<Emailer> emailer)
        : repository_(std::move(repository))
        , emailer_(std::move(emailer))
    {
        ++creations()["UserSvc"];
    }

    std::string createUser(const std::string& name) override
    {
        return emailer_->welcome(name + "@" + repository_->findById(1));
    }

    std::shared_ptr<Repository> repository() const override
    {
        return repository_;
    }

    std::shared_ptr<Emailer> emailer() const override
    {
        return emailer_;
    }

private:
    std::shared_ptr<Repository> repository_;
    std::shared_ptr<Emailer> emailer_;
};

// Sends mail through the user service, which itself needs an Emailer
class CyclicEmail : public Emailer
{
public:
    explicit CyclicEmail(std::shared_ptr<UserService> users)
        : users_(std::move(users))
    {
        ++creations()["CyclicEmail"];
    }

    std::string welcome(const std::string& user) override
    {
        return users_->createUser(user);
    }

private:
    std::shared_ptr<UserService> users_;
};

//----------------------------------------------------------------------------------------------------------------------
// Diamond: Top -> (Left, Right) -> Bottom

class IBottom
{
public:
    virtual ~IBottom()
    {
    }
};

class ILeft
{
public:
    virtual ~ILeft()
    {
    }

    virtual std::shared_ptr<IBottom> bottom() const = 0;
};

class IRight
{
public:
    virtual ~IRight()
    {
    }

    virtual std::shared_ptr<IBottom> bottom() const = 0;
};

class ITop
{
public:
    virtual ~ITop()
    {
    }

    virtual std::shared_ptr<ILeft> left() const = 0;
    virtual std::shared_ptr<IRight> right() const = 0;
};

class Bottom : public IBottom
{
public:
    Bottom()
    {
        ++creations()["Bottom"];
    }
};

class Left : public ILeft
{
public:
    explicit Left(std::shared_ptr<IBottom> bottom)
        : bottom_(std::move(bottom))
    {
        ++creations()["Left"];
    }

    std::shared_ptr<IBottom> bottom() const override
    {
        return bottom_;
    }

private:
    std::shared_ptr<IBottom> bottom_;
};

class Right : public IRight
{
public:
    explicit Right(std::shared_ptr<IBottom> bottom)
        : bottom_(std::move(bottom))
    {
        ++creations()["Right"];
    }

    std::shared_ptr<IBottom> bottom() const override
    {
        return bottom_;
    }

private:
    std::shared_ptr<IBottom> bottom_;
};

class Top : public ITop
{
public:
    Top(std::shared_ptr<ILeft> left, std::shared_ptr<IRight> right)
        : left_(std::move(left))
        , right_(std::move(right))
    {
        ++creations()["Top"];
    }

    std::shared_ptr<ILeft> left() const override
    {
        return left_;
    }

    std::shared_ptr<IRight> right() const override
    {
        return right_;
    }

private:
    std::shared_ptr<ILeft> left_;
    std::shared_ptr<IRight> right_;
};

//----------------------------------------------------------------------------------------------------------------------
// Cycles

class ISelf
{
public:
    virtual ~ISelf()
    {
    }
};

class Self : public ISelf
{
public:
    explicit Self(std::shared_ptr<ISelf>)
    {
        ++creations()["Self"];
    }
};

class IA
{
public:
    virtual ~IA()
    {
    }
};

class IB
{
public:
    virtual ~IB()
    {
    }
};

class IC
{
public:
    virtual ~IC()
    {
    }
};

class A : public IA
{
public:
    explicit A(std::shared_ptr<IB>)
    {
        ++creations()["A"];
    }
};

class B : public IB
{
public:
    explicit B(std::shared_ptr<IC>)
    {
        ++creations()["B"];
    }
};

class C : public IC
{
public:
    explicit C(std::shared_ptr<IA>)
    {
        ++creations()["C"];
    }
};

// Breaks the A -> B -> C -> A cycle
class LeafC : public IC
{
public:
    LeafC()
    {
        ++creations()["LeafC"];
    }
};

//----------------------------------------------------------------------------------------------------------------------
// One implementation behind two capabilities

class IFirst
{
public:
    virtual ~IFirst()
    {
    }
};

class ISecond
{
public:
    virtual ~ISecond()
    {
    }
};

class Both : public IFirst, public ISecond
{
public:
    Both()
    {
        ++creations()["Both"];
    }
};

// Implements IFirst and ISecond and requires ISecond, i.e. itself
class BothNeedingSecond : public IFirst, public ISecond
{
public:
    explicit BothNeedingSecond(std::shared_ptr<ISecond>)
    {
        ++creations()["BothNeedingSecond"];
    }
};

//----------------------------------------------------------------------------------------------------------------------
// Failures

class IFaulty
{
public:
    virtual ~IFaulty()
    {
    }
};

class Faulty : public IFaulty
{
public:
    Faulty()
    {
        throw std::runtime_error("disk on fire");
    }
};

class NeedsFaulty : public ISelf
{
public:
    explicit NeedsFaulty(std::shared_ptr<IFaulty>)
    {
        ++creations()["NeedsFaulty"];
    }
};

/// Resets the creation counters and provides a quiet container
class ContainerFixture
{
public:
    ContainerFixture()
        : container(quietOptions())
    {
        creations().clear();
    }

    cppinject::Container container;
};

} // fixtures
