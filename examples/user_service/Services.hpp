#pragma once

#include <memory>
#include <string>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include <spdlog/spdlog.h>

#include <cppinject/ComponentSource.hpp>

namespace example
{

class UserRepository
{
public:
    virtual ~UserRepository()
    {
    }

    virtual void save(const std::string& user) = 0;
    virtual std::string findById(long id) const = 0;
};

class UserService
{
public:
    virtual ~UserService()
    {
    }

    virtual std::string createUser(const std::string& name, const std::string& email) = 0;
    virtual std::string getUser(long id) const = 0;
};

class UserRepositoryImpl : public UserRepository
{
public:
    void save(const std::string& user) override
    {
        spdlog::info("Saving user to database: {}", user);
    }

    std::string findById(long id) const override
    {
        spdlog::info("Finding user by id: {}", id);
        return "1/John/john@jhonny.com";
    }
};

// Users are stored as "id/name/email"
inline std::string emailOf(const std::string& user)
{
    std::vector<std::string> fields;
    boost::algorithm::split(fields, user, boost::algorithm::is_any_of("/"));
    return fields.size() > 2 ? fields[2] : std::string();
}

namespace valid
{

class EmailService
{
public:
    virtual ~EmailService()
    {
    }

    virtual void sendWelcomeEmail(const std::string& user) = 0;
};

class EmailServiceImpl : public EmailService
{
public:
    void sendWelcomeEmail(const std::string& user) override
    {
        spdlog::info("Sending welcome email to: {}", emailOf(user));
    }
};

class UserServiceImpl : public UserService
{
public:
    UserServiceImpl(std::shared_ptr<UserRepository> userRepository,
                    std::shared_ptr<EmailService> emailService)
        : userRepository_(std::move(userRepository))
        , emailService_(std::move(emailService))
    {
    }

    std::string createUser(const std::string& name, const std::string& email) override
    {
        std::string user = "1/" + name + "/" + email;
        userRepository_->save(user);
        emailService_->sendWelcomeEmail(user);
        return user;
    }

    std::string getUser(long id) const override
    {
        return userRepository_->findById(id);
    }

private:
    std::shared_ptr<UserRepository> userRepository_;
    std::shared_ptr<EmailService> emailService_;
};

} // valid

namespace circular
{

class UserRepositoryImpl : public example::UserRepositoryImpl
{
};

class EmailService
{
public:
    virtual ~EmailService()
    {
    }

    virtual void sendWelcomeEmail(long userId) = 0;
};

// Needs the user service, which in turn needs this email service
class EmailServiceImpl : public EmailService
{
public:
    explicit EmailServiceImpl(std::shared_ptr<UserService> userService)
        : userService_(std::move(userService))
    {
    }

    void sendWelcomeEmail(long userId) override
    {
        spdlog::info("Sending welcome email to: {}", emailOf(userService_->getUser(userId)));
    }

private:
    std::shared_ptr<UserService> userService_;
};

class UserServiceImpl : public UserService
{
public:
    UserServiceImpl(std::shared_ptr<UserRepository> userRepository,
                    std::shared_ptr<EmailService> emailService)
        : userRepository_(std::move(userRepository))
        , emailService_(std::move(emailService))
    {
    }

    std::string createUser(const std::string& name, const std::string& email) override
    {
        std::string user = "1/" + name + "/" + email;
        userRepository_->save(user);
        emailService_->sendWelcomeEmail(1);
        return user;
    }

    std::string getUser(long id) const override
    {
        return userRepository_->findById(id);
    }

private:
    std::shared_ptr<UserRepository> userRepository_;
    std::shared_ptr<EmailService> emailService_;
};

} // circular

/// Every example component, filed under "example.valid" and "example.circular"
inline cppinject::ComponentCatalog makeCatalog()
{
    using cppinject::Implements;
    using cppinject::Requires;

    cppinject::ComponentCatalog catalog("example");

    catalog.add<valid::EmailServiceImpl>("example.valid.service.email",
                                         Implements<valid::EmailService>{});
    catalog.add<valid::UserServiceImpl>("example.valid.service.user",
                                        Implements<UserService>{},
                                        Requires<UserRepository, valid::EmailService>{});
    catalog.add<UserRepositoryImpl>("example.valid.repository", Implements<UserRepository>{});

    catalog.add<circular::UserRepositoryImpl>("example.circular.repository",
                                              Implements<UserRepository>{});
    catalog.add<circular::EmailServiceImpl>("example.circular.service.email",
                                            Implements<circular::EmailService>{},
                                            Requires<UserService>{});
    catalog.add<circular::UserServiceImpl>("example.circular.service.user",
                                           Implements<UserService>{},
                                           Requires<UserRepository, circular::EmailService>{});

    return catalog;
}

} // example
