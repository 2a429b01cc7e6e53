#include <ssh/session.hpp>
#include <ssh/sftp_session.hpp>
#include <ssh/async/processing_strand.hpp>
#include <log/log.hpp>

#include <libssh/sftp.h>

#include <algorithm>

namespace SecureShell
{
    Session::Session()
        : processingThread_{}
        , session_{}
        , sftpSessionGuard_{}
        , sftpSessions_{}
    {}

    Session::~Session()
    {
        shutdown();
    }

    void Session::start()
    {
        processingThread_.start(std::chrono::milliseconds{100});
    }

    void Session::stop()
    {
        processingThread_.stop();
    }

    bool Session::isRunning() const
    {
        return processingThread_.isRunning();
    }

    void Session::shutdown()
    {
        std::vector<std::shared_ptr<SftpSession>> alive{};
        {
            std::scoped_lock lock{sftpSessionGuard_};
            for (auto const& weak : sftpSessions_)
            {
                if (auto sftp = weak.lock(); sftp)
                    alive.push_back(std::move(sftp));
            }
            sftpSessions_.clear();
        }
        for (auto const& sftp : alive)
            sftp->close();

        processingThread_.pushTask([this]() {
            session_.disconnect();
        });
        processingThread_.stop();
    }

    std::future<std::expected<std::shared_ptr<ISftpClient>, SftpError>> Session::openSftpChannel()
    {
        return processingThread_.pushPromiseTask([this]() -> std::expected<std::shared_ptr<ISftpClient>, SftpError> {
            ssh_session raw = session_.getCSession();
            sftp_session sftp = sftp_new(raw);
            if (sftp == nullptr)
            {
                return std::unexpected(SftpError{
                    .message = ssh_get_error(raw),
                    .sshError = ssh_get_error_code(raw),
                    .wrapperError = ssh_is_connected(raw) ? WrapperErrors::None : WrapperErrors::ConnectionLost,
                });
            }

            if (sftp_init(sftp) != SSH_OK)
            {
                SftpError error{
                    .message = ssh_get_error(raw),
                    .sshError = ssh_get_error_code(raw),
                    .sftpError = sftp_get_error(sftp),
                };
                sftp_free(sftp);
                Log::warn("Session: Server refused sftp channel: {}", error.message);
                return std::unexpected(std::move(error));
            }

            auto sftpSession = std::make_shared<SftpSession>(raw, processingThread_.createStrand(), sftp);
            {
                std::scoped_lock lock{sftpSessionGuard_};
                std::erase_if(sftpSessions_, [](auto const& weak) {
                    return weak.expired();
                });
                sftpSessions_.push_back(sftpSession);
            }
            return sftpSession;
        });
    }
}
