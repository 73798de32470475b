#include "git_utils.hpp"
#include <cstring>

using namespace std;

namespace git {

namespace {

const char* const kHeadsPrefix = "refs/heads/";

/**
 * @brief Populate an error string with the last libgit2 error message.
 *
 * @param error   Output string receiving the error description.
 * @param context Optional prefix naming the failed operation.
 */
void set_error(std::string* error, const char* context = nullptr) {
    if (!error)
        return;
    const git_error* e = git_error_last();
    std::string msg = (e && e->message) ? e->message : "Unknown libgit2 error";
    *error = context ? std::string(context) + ": " + msg : msg;
}

void set_message(std::string* error, const std::string& msg) {
    if (error)
        *error = msg;
}

string oid_to_hex(const git_oid& oid) {
    char buf[GIT_OID_HEXSZ + 1];
    git_oid_tostr(buf, sizeof(buf), &oid);
    return string(buf);
}

git_repository* open_repo(const fs::path& repo, std::string* error) {
    git_repository* raw = nullptr;
    if (git_repository_open(&raw, repo.string().c_str()) != 0) {
        set_error(error, "open repository");
        return nullptr;
    }
    return raw;
}

std::optional<std::string> config_string(git_config* cfg, const char* key) {
    const char* val = nullptr;
    if (git_config_get_string(&val, cfg, key) != 0 || !val || !*val)
        return std::nullopt;
    return std::string(val);
}

/// State shared with the push callbacks for one git_remote_push call.
struct PushState {
    const PushCredentials* creds;
    int attempts = 0;
    std::string rejection;
};

int push_credential_cb(git_credential** out, const char* url, const char* username_from_url,
                       unsigned int allowed_types, void* payload) {
    auto* state = static_cast<PushState*>(payload);
    // libgit2 asks again after a refused credential; one attempt is enough.
    if (++state->attempts > 1)
        return GIT_EUSER;
    return credential_cb(out, url, username_from_url, allowed_types,
                         const_cast<PushCredentials*>(state->creds));
}

int push_update_reference_cb(const char* refname, const char* status, void* payload) {
    if (status) {
        auto* state = static_cast<PushState*>(payload);
        state->rejection = std::string(refname) + " rejected: " + status;
    }
    return 0;
}

} // namespace

GitInitGuard::GitInitGuard() { git_libgit2_init(); }

GitInitGuard::~GitInitGuard() { git_libgit2_shutdown(); }

int credential_cb(git_credential** out, const char* url, const char* username_from_url,
                  unsigned int allowed_types, void* payload) {
    (void)url;
    const auto* creds = static_cast<const PushCredentials*>(payload);
    if (!(allowed_types & GIT_CREDENTIAL_USERPASS_PLAINTEXT))
        return GIT_PASSTHROUGH;
    if (creds && !creds->password.empty()) {
        const char* user = !creds->username.empty() ? creds->username.c_str()
                           : username_from_url      ? username_from_url
                                                    : "x-access-token";
        return git_credential_userpass_plaintext_new(out, user, creds->password.c_str());
    }
    // https://<token>@host/...: the token travels as the username.
    if (username_from_url && *username_from_url)
        return git_credential_userpass_plaintext_new(out, username_from_url, "x-oauth-basic");
    return GIT_PASSTHROUGH;
}

bool is_git_repo(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p / ".git", ec);
}

std::optional<Identity> configured_identity(const fs::path& workspace, std::string* error) {
    git_config* raw_cfg = nullptr;
    if (is_git_repo(workspace)) {
        repo_ptr r(open_repo(workspace, error));
        if (!r.get())
            return nullopt;
        if (git_repository_config_snapshot(&raw_cfg, r.get()) != 0) {
            set_error(error, "read repository config");
            return nullopt;
        }
    } else {
        git_config* raw_default = nullptr;
        if (git_config_open_default(&raw_default) != 0) {
            set_error(error, "read global config");
            return nullopt;
        }
        config_ptr def(raw_default);
        if (git_config_snapshot(&raw_cfg, def.get()) != 0) {
            set_error(error, "read global config");
            return nullopt;
        }
    }
    config_ptr cfg(raw_cfg);
    auto name = config_string(cfg.get(), "user.name");
    auto email = config_string(cfg.get(), "user.email");
    if (!name || !email) {
        set_message(error, !name ? "user.name is not configured" : "user.email is not configured");
        return nullopt;
    }
    return Identity{*name, *email};
}

bool open_or_init(const fs::path& workspace, std::string* error) {
    git_repository* raw = nullptr;
    if (is_git_repo(workspace)) {
        if (git_repository_open(&raw, workspace.string().c_str()) != 0) {
            set_error(error, "open repository");
            return false;
        }
    } else if (git_repository_init(&raw, workspace.string().c_str(), 0) != 0) {
        set_error(error, "init repository");
        return false;
    }
    repo_ptr r(raw);
    return true;
}

bool bind_remote(const fs::path& repo, const std::string& name, const std::string& url,
                 std::string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return false;
    int rc = git_remote_delete(r.get(), name.c_str());
    if (rc != 0 && rc != GIT_ENOTFOUND) {
        set_error(error, "remove remote");
        return false;
    }
    git_remote* raw_remote = nullptr;
    if (git_remote_create(&raw_remote, r.get(), name.c_str(), url.c_str()) != 0) {
        set_error(error, "create remote");
        return false;
    }
    remote_ptr remote(raw_remote);
    return true;
}

optional<string> get_remote_url(const fs::path& repo, const string& remote, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote.c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    remote_ptr remote_handle(raw_remote);
    const char* url = git_remote_url(remote_handle.get());
    if (!url) {
        set_error(error);
        return nullopt;
    }
    return string(url);
}

optional<string> commit_paths(const fs::path& repo, const vector<string>& paths,
                              const string& message, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_index* raw_index = nullptr;
    if (git_repository_index(&raw_index, r.get()) != 0) {
        set_error(error, "open index");
        return nullopt;
    }
    index_ptr index(raw_index);
    if (paths.empty()) {
        if (git_index_add_all(index.get(), nullptr, GIT_INDEX_ADD_DEFAULT, nullptr, nullptr) != 0) {
            set_error(error, "stage files");
            return nullopt;
        }
        // add_all never drops entries for files removed from the work tree
        if (git_index_update_all(index.get(), nullptr, nullptr, nullptr) != 0) {
            set_error(error, "stage removals");
            return nullopt;
        }
    } else {
        for (const auto& p : paths) {
            if (git_index_add_bypath(index.get(), p.c_str()) != 0) {
                set_error(error, ("stage " + p).c_str());
                return nullopt;
            }
        }
    }
    if (git_index_write(index.get()) != 0) {
        set_error(error, "write index");
        return nullopt;
    }
    git_oid tree_oid;
    if (git_index_write_tree(&tree_oid, index.get()) != 0) {
        set_error(error, "write tree");
        return nullopt;
    }
    git_tree* raw_tree = nullptr;
    if (git_tree_lookup(&raw_tree, r.get(), &tree_oid) != 0) {
        set_error(error, "lookup tree");
        return nullopt;
    }
    tree_ptr tree(raw_tree);

    commit_ptr parent;
    git_oid parent_oid;
    if (git_reference_name_to_id(&parent_oid, r.get(), "HEAD") == 0) {
        git_commit* raw_parent = nullptr;
        if (git_commit_lookup(&raw_parent, r.get(), &parent_oid) != 0) {
            set_error(error, "lookup HEAD commit");
            return nullopt;
        }
        parent.h = raw_parent;
        if (git_oid_equal(&tree_oid, git_commit_tree_id(parent.get()))) {
            set_message(error, "nothing to commit: tree unchanged from HEAD");
            return nullopt;
        }
    } else if (git_tree_entrycount(tree.get()) == 0) {
        set_message(error, "nothing to commit: no files staged");
        return nullopt;
    }

    git_signature* raw_sig = nullptr;
    if (git_signature_default(&raw_sig, r.get()) != 0) {
        set_error(error, "commit identity");
        return nullopt;
    }
    signature_ptr sig(raw_sig);
    git_oid commit_oid;
    int rc = parent.get() ? git_commit_create_v(&commit_oid, r.get(), "HEAD", sig.get(), sig.get(),
                                                nullptr, message.c_str(), tree.get(), 1,
                                                parent.get())
                          : git_commit_create_v(&commit_oid, r.get(), "HEAD", sig.get(), sig.get(),
                                                nullptr, message.c_str(), tree.get(), 0);
    if (rc != 0) {
        set_error(error, "create commit");
        return nullopt;
    }
    return oid_to_hex(commit_oid);
}

vector<string> changed_paths(const fs::path& repo, const string& rev, string* error) {
    vector<string> out;
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return out;
    git_object* raw_obj = nullptr;
    if (git_revparse_single(&raw_obj, r.get(), rev.c_str()) != 0) {
        set_error(error, ("resolve " + rev).c_str());
        return out;
    }
    object_ptr obj(raw_obj);
    git_object* raw_commit = nullptr;
    if (git_object_peel(&raw_commit, obj.get(), GIT_OBJECT_COMMIT) != 0) {
        set_error(error);
        return out;
    }
    commit_ptr commit(reinterpret_cast<git_commit*>(raw_commit));
    git_tree* raw_tree = nullptr;
    if (git_commit_tree(&raw_tree, commit.get()) != 0) {
        set_error(error);
        return out;
    }
    tree_ptr tree(raw_tree);
    tree_ptr parent_tree;
    if (git_commit_parentcount(commit.get()) > 0) {
        git_commit* raw_parent = nullptr;
        if (git_commit_parent(&raw_parent, commit.get(), 0) != 0) {
            set_error(error);
            return out;
        }
        commit_ptr parent(raw_parent);
        git_tree* raw_ptree = nullptr;
        if (git_commit_tree(&raw_ptree, parent.get()) != 0) {
            set_error(error);
            return out;
        }
        parent_tree.h = raw_ptree;
    }
    git_diff* raw_diff = nullptr;
    if (git_diff_tree_to_tree(&raw_diff, r.get(), parent_tree.get(), tree.get(), nullptr) != 0) {
        set_error(error, "diff");
        return out;
    }
    diff_ptr diff(raw_diff);
    size_t n = git_diff_num_deltas(diff.get());
    for (size_t i = 0; i < n; ++i) {
        const git_diff_delta* delta = git_diff_get_delta(diff.get(), i);
        if (delta && delta->new_file.path)
            out.emplace_back(delta->new_file.path);
    }
    return out;
}

optional<string> get_current_branch(const fs::path& repo, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    if (git_repository_head_unborn(r.get()) == 1) {
        git_reference* raw_head = nullptr;
        if (git_reference_lookup(&raw_head, r.get(), "HEAD") != 0) {
            set_error(error);
            return nullopt;
        }
        reference_ptr head(raw_head);
        const char* target = git_reference_symbolic_target(head.get());
        if (!target || std::strncmp(target, kHeadsPrefix, std::strlen(kHeadsPrefix)) != 0) {
            set_message(error, "HEAD does not point to a branch");
            return nullopt;
        }
        return string(target + std::strlen(kHeadsPrefix));
    }
    git_reference* head = nullptr;
    if (git_repository_head(&head, r.get()) != 0) {
        set_error(error);
        return nullopt;
    }
    reference_ptr ref(head);
    if (!git_reference_is_branch(ref.get())) {
        set_message(error, "HEAD is detached");
        return nullopt;
    }
    const char* name = git_reference_shorthand(ref.get());
    return string(name ? name : "");
}

bool rename_current_branch(const fs::path& repo, const string& new_name, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return false;
    string target = kHeadsPrefix + new_name;
    if (git_repository_head_unborn(r.get()) == 1) {
        git_reference* raw = nullptr;
        if (git_reference_symbolic_create(&raw, r.get(), "HEAD", target.c_str(), 1,
                                          "rename unborn branch") != 0) {
            set_error(error, "retarget HEAD");
            return false;
        }
        reference_ptr ref(raw);
        return true;
    }
    git_reference* raw_head = nullptr;
    if (git_repository_head(&raw_head, r.get()) != 0) {
        set_error(error, "read HEAD");
        return false;
    }
    reference_ptr head(raw_head);
    if (!git_reference_is_branch(head.get())) {
        set_message(error, "HEAD is detached");
        return false;
    }
    if (target == git_reference_name(head.get()))
        return true;
    git_reference* raw_moved = nullptr;
    if (git_branch_move(&raw_moved, head.get(), new_name.c_str(), 1) != 0) {
        set_error(error, ("rename branch to " + new_name).c_str());
        return false;
    }
    reference_ptr moved(raw_moved);
    return true;
}

bool create_branch(const fs::path& repo, const string& name, const string& base, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return false;
    git_reference* raw_base = nullptr;
    if (git_branch_lookup(&raw_base, r.get(), base.c_str(), GIT_BRANCH_LOCAL) != 0) {
        set_error(error, ("lookup branch " + base).c_str());
        return false;
    }
    reference_ptr base_ref(raw_base);
    git_object* raw_commit = nullptr;
    if (git_reference_peel(&raw_commit, base_ref.get(), GIT_OBJECT_COMMIT) != 0) {
        set_error(error);
        return false;
    }
    object_ptr commit(raw_commit);
    git_reference* raw_new = nullptr;
    if (git_branch_create(&raw_new, r.get(), name.c_str(),
                          reinterpret_cast<const git_commit*>(commit.get()), 0) != 0) {
        set_error(error, ("create branch " + name).c_str());
        return false;
    }
    reference_ptr created(raw_new);
    return true;
}

bool checkout_branch(const fs::path& repo, const string& name, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return false;
    string refname = kHeadsPrefix + name;
    git_object* raw_obj = nullptr;
    if (git_revparse_single(&raw_obj, r.get(), refname.c_str()) != 0) {
        set_error(error, ("resolve " + refname).c_str());
        return false;
    }
    object_ptr target(raw_obj);
    git_checkout_options opts = GIT_CHECKOUT_OPTIONS_INIT;
    opts.checkout_strategy = GIT_CHECKOUT_SAFE;
    if (git_checkout_tree(r.get(), target.get(), &opts) != 0) {
        set_error(error, "checkout");
        return false;
    }
    if (git_repository_set_head(r.get(), refname.c_str()) != 0) {
        set_error(error, "set HEAD");
        return false;
    }
    return true;
}

bool push_branch(const fs::path& repo, const string& remote, const string& branch,
                 const PushCredentials* creds, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return false;
    git_remote* raw_remote = nullptr;
    if (git_remote_lookup(&raw_remote, r.get(), remote.c_str()) != 0) {
        set_error(error, ("lookup remote " + remote).c_str());
        return false;
    }
    remote_ptr remote_handle(raw_remote);
    PushState state{creds};
    git_push_options opts = GIT_PUSH_OPTIONS_INIT;
    opts.callbacks.credentials = push_credential_cb;
    opts.callbacks.push_update_reference = push_update_reference_cb;
    opts.callbacks.payload = &state;
    string refspec = kHeadsPrefix + branch + ":" + kHeadsPrefix + branch;
    char* specs[] = {refspec.data()};
    git_strarray refspecs = {specs, 1};
    int rc = git_remote_push(remote_handle.get(), &refspecs, &opts);
    if (rc == GIT_EUSER && state.attempts > 1) {
        set_message(error, "push " + branch + ": authentication rejected by remote");
        return false;
    }
    if (rc != 0) {
        set_error(error, ("push " + branch).c_str());
        return false;
    }
    if (!state.rejection.empty()) {
        set_message(error, state.rejection);
        return false;
    }
    return true;
}

bool set_upstream(const fs::path& repo, const string& branch, const string& remote,
                  string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return false;
    git_config* raw_cfg = nullptr;
    if (git_repository_config(&raw_cfg, r.get()) != 0) {
        set_error(error, "open config");
        return false;
    }
    config_ptr cfg(raw_cfg);
    string section = "branch." + branch;
    string merge = kHeadsPrefix + branch;
    if (git_config_set_string(cfg.get(), (section + ".remote").c_str(), remote.c_str()) != 0 ||
        git_config_set_string(cfg.get(), (section + ".merge").c_str(), merge.c_str()) != 0) {
        set_error(error, "set upstream");
        return false;
    }
    return true;
}

optional<string> get_upstream(const fs::path& repo, const string& branch) {
    repo_ptr r(open_repo(repo, nullptr));
    if (!r.get())
        return nullopt;
    git_config* raw_cfg = nullptr;
    if (git_repository_config_snapshot(&raw_cfg, r.get()) != 0)
        return nullopt;
    config_ptr cfg(raw_cfg);
    auto remote = config_string(cfg.get(), ("branch." + branch + ".remote").c_str());
    auto merge = config_string(cfg.get(), ("branch." + branch + ".merge").c_str());
    if (!remote || !merge)
        return nullopt;
    string short_merge = *merge;
    if (short_merge.rfind(kHeadsPrefix, 0) == 0)
        short_merge.erase(0, std::strlen(kHeadsPrefix));
    return *remote + "/" + short_merge;
}

optional<string> resolve_ref(const fs::path& repo, const string& rev, string* error) {
    repo_ptr r(open_repo(repo, error));
    if (!r.get())
        return nullopt;
    git_object* raw_obj = nullptr;
    if (git_revparse_single(&raw_obj, r.get(), rev.c_str()) != 0) {
        set_error(error);
        return nullopt;
    }
    object_ptr obj(raw_obj);
    git_object* raw_commit = nullptr;
    if (git_object_peel(&raw_commit, obj.get(), GIT_OBJECT_COMMIT) != 0) {
        set_error(error);
        return nullopt;
    }
    object_ptr commit(raw_commit);
    return oid_to_hex(*git_object_id(commit.get()));
}

} // namespace git
