#include "beright/app/app_context.hpp"
#include "beright/app/cli_args.hpp"
#include "beright/memo/memo_codec.hpp"
#include "beright/scoring/brier.hpp"

#include <boost/program_options.hpp>

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace
{

  namespace po = boost::program_options;

  constexpr int EXIT_USAGE = 2;

  struct CommandLine
  {
    std::string config_path;
    // False when config_path is the default.
    bool config_given = false;
    std::optional<std::string> on_behalf;
    bool retry = true;
    std::string command;
    std::vector<std::string> args;
  };

  void print_usage(const po::options_description &visible)
  {
    std::cerr << "usage: beright [options] <command> [args...]\n\n"
              << "commands:\n"
              << "  commit <ticker> <probability> <YES|NO>\n"
              << "  resolve <ticker> <probability> <YES|NO> <OCCURRED|DID_NOT_OCCUR>\n"
              << "  batch <ticker> <probability> <YES|NO> [<ticker> <probability> <YES|NO>...]\n"
              << "  reconcile <ticker> <probability> <YES|NO>\n"
              << "  balance\n"
              << "  decode <memo>\n"
              << "  score <probability> <OCCURRED|DID_NOT_OCCUR> [...]\n\n"
              << visible << std::endl;
  }

  std::optional<CommandLine> parse_command_line(int argc, char **argv)
  {
    po::options_description visible("options");
    visible.add_options()("help,h", "show this help")(
        "config,c", po::value<std::string>()->default_value("config.json"), "path to config.json")(
        "on-behalf", po::value<std::string>(), "forecaster public key when signing for them")(
        "no-retry", "submit once, without backoff retries");

    po::options_description hidden;
    hidden.add_options()("command", po::value<std::string>())(
        "args", po::value<std::vector<std::string>>());

    po::options_description all;
    all.add(visible).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    po::variables_map option_variables;
    try
    {
      po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(),
                option_variables);
      po::notify(option_variables);
    }
    catch (const po::error &e)
    {
      std::cerr << e.what() << std::endl;
      print_usage(visible);
      return std::nullopt;
    }

    if (option_variables.count("help") || !option_variables.count("command"))
    {
      print_usage(visible);
      return std::nullopt;
    }

    CommandLine line{.config_path = option_variables["config"].as<std::string>(),
                     .config_given = !option_variables["config"].defaulted(),
                     .on_behalf = std::nullopt,
                     .retry = option_variables.count("no-retry") == 0,
                     .command = option_variables["command"].as<std::string>(),
                     .args = {}};
    if (option_variables.count("on-behalf"))
    {
      line.on_behalf = option_variables["on-behalf"].as<std::string>();
    }
    if (option_variables.count("args"))
    {
      line.args = option_variables["args"].as<std::vector<std::string>>();
    }
    return line;
  }

  // CLI arguments report their own errors; callers exit with EXIT_USAGE.
  std::optional<double> probability_arg(std::string_view text)
  {
    auto value = beright::app::parse_probability(text);
    if (!value)
    {
      std::cerr << beright::app::to_string(value.error()) << ": " << text << std::endl;
      return std::nullopt;
    }
    return *value;
  }

  std::optional<bool> outcome_arg(std::string_view text)
  {
    auto value = beright::app::parse_outcome(text);
    if (!value)
    {
      std::cerr << beright::app::to_string(value.error()) << ": " << text << std::endl;
      return std::nullopt;
    }
    return *value;
  }

  std::optional<beright::memo::Direction> direction_arg(std::string_view text)
  {
    auto value = beright::app::parse_direction(text);
    if (!value)
    {
      std::cerr << beright::app::to_string(value.error()) << ": " << text << std::endl;
      return std::nullopt;
    }
    return *value;
  }

  int report_failure(const beright::service::CommitFailure &failure)
  {
    if (beright::service::is_user_facing(failure.error))
    {
      std::cerr << "commit failed (" << beright::service::to_string(failure.error) << " during "
                << beright::service::to_string(failure.stage) << "): " << failure.message
                << std::endl;
    }
    else
    {
      std::cerr << "commit failed: internal error, see log" << std::endl;
    }
    if (failure.signature)
    {
      std::cerr << "unconfirmed signature: " << *failure.signature << std::endl;
    }
    return 1;
  }

  void print_receipt(const beright::service::CommitReceipt &receipt)
  {
    std::cout << "signature: " << receipt.signature << "\n"
              << "explorer:  " << receipt.explorer_url << "\n"
              << "memo:      " << receipt.memo << std::endl;
  }

  int run_decode(const std::vector<std::string> &args, const beright::app::OfflineSettings &settings)
  {
    if (args.size() != 1)
    {
      std::cerr << "decode takes exactly one memo" << std::endl;
      return EXIT_USAGE;
    }
    auto record = beright::memo::decode(args[0], settings.limits);
    if (!record)
    {
      std::cout << "no parse" << std::endl;
      return 1;
    }
    if (const auto *prediction = std::get_if<beright::memo::PredictionCommitment>(&*record))
    {
      std::cout << "kind:        PREDICT\n"
                << "ticker:      " << prediction->market_ticker << "\n"
                << "probability: " << prediction->probability << "\n"
                << "direction:   " << beright::memo::to_string(prediction->direction) << "\n"
                << "committer:   " << prediction->committer_ref << std::endl;
      return 0;
    }
    const auto &resolution = std::get<beright::memo::ResolutionRecord>(*record);
    const auto band = beright::scoring::interpret_brier_score(resolution.brier_score, settings.bands);
    std::cout << "kind:        RESOLVE\n"
              << "ticker:      " << resolution.market_ticker << "\n"
              << "occurred:    " << (resolution.direction_occurred ? "yes" : "no") << "\n"
              << "brier_score: " << resolution.brier_score << "\n"
              << "band:        " << beright::scoring::to_string(band) << std::endl;
    return 0;
  }

  int run_score(const std::vector<std::string> &args, const beright::app::OfflineSettings &settings)
  {
    if (args.empty() || args.size() % 2 != 0)
    {
      std::cerr << "score takes <probability> <outcome> pairs" << std::endl;
      return EXIT_USAGE;
    }
    std::vector<double> scores;
    for (std::size_t i = 0; i < args.size(); i += 2)
    {
      auto probability = probability_arg(args[i]);
      auto occurred = outcome_arg(args[i + 1]);
      if (!probability || !occurred)
      {
        return EXIT_USAGE;
      }
      const double score = beright::scoring::brier_score(*probability, *occurred);
      const auto band = beright::scoring::interpret_brier_score(score, settings.bands);
      std::cout << args[i] << " " << args[i + 1] << ": " << score << " "
                << beright::scoring::to_string(band) << " (" << beright::scoring::describe(band)
                << ")" << std::endl;
      scores.push_back(score);
    }
    if (scores.size() > 1)
    {
      auto mean = beright::scoring::mean_brier_score(scores);
      if (mean)
      {
        std::cout << "mean: " << *mean << " "
                  << beright::scoring::to_string(
                         beright::scoring::interpret_brier_score(*mean, settings.bands))
                  << std::endl;
      }
    }
    return 0;
  }

  int run_balance(const beright::app::AppContext &ctx, const beright::Signer &signer)
  {
    auto affordability = ctx.gateway().get_affordability(
        signer, std::chrono::milliseconds(ctx.config().ledger.rpc_timeout_ms));
    if (!affordability)
    {
      std::cerr << "balance query failed: " << affordability.error().message << std::endl;
      return 1;
    }
    std::cout << "account:     " << signer.address() << "\n"
              << "lamports:    " << affordability->spendable_lamports << "\n"
              << "sol:         "
              << static_cast<double>(affordability->spendable_lamports) /
                     static_cast<double>(beright::ledger::LAMPORTS_PER_SOL)
              << "\n"
              << "commitments: " << affordability->estimated_remaining_commitments << "\n"
              << "can_commit:  " << (affordability->can_commit ? "yes" : "no") << std::endl;
    return 0;
  }

  int run_batch(const beright::app::AppContext &ctx, const beright::Signer &signer,
                const CommandLine &line)
  {
    const auto &args = line.args;
    if (args.empty() || args.size() % 3 != 0)
    {
      std::cerr << "batch takes <ticker> <probability> <YES|NO> triples" << std::endl;
      return EXIT_USAGE;
    }
    const std::string committer = line.on_behalf.value_or(signer.address());
    std::vector<beright::service::BatchPrediction> predictions;
    for (std::size_t i = 0; i < args.size(); i += 3)
    {
      auto probability = probability_arg(args[i + 1]);
      auto direction = direction_arg(args[i + 2]);
      if (!probability || !direction)
      {
        return EXIT_USAGE;
      }
      predictions.push_back(beright::service::BatchPrediction{.committer_public_key = committer,
                                                              .market_ticker = args[i],
                                                              .probability = *probability,
                                                              .direction = *direction});
    }

    auto result = ctx.service().commit_batch(signer, predictions);
    if (!result)
    {
      return report_failure(result.error());
    }
    std::cout << "signature: " << result->signature << "\n"
              << "explorer:  " << result->explorer_url << std::endl;
    for (const auto &memo : result->memos)
    {
      std::cout << "memo:      " << memo << std::endl;
    }
    return 0;
  }

  int run_ledger_command(const CommandLine &line)
  {
    auto ctx = beright::app::AppContext::build(line.config_path);
    if (!ctx)
    {
      return 1;
    }
    ctx->log_config();

    auto signer = ctx->load_signer();
    if (!signer)
    {
      std::cerr << "signer unavailable: set BERIGHT_KEYPAIR_PATH or BERIGHT_PRIVATE_KEY"
                << std::endl;
      return 1;
    }
    if (line.command == "balance")
    {
      return run_balance(*ctx, *signer);
    }
    if (line.command == "batch")
    {
      return run_batch(*ctx, *signer, line);
    }

    const auto &args = line.args;
    const std::size_t expected = line.command == "resolve" ? 4 : 3;
    if (args.size() != expected)
    {
      std::cerr << line.command << " takes " << expected << " arguments" << std::endl;
      return EXIT_USAGE;
    }
    auto probability = probability_arg(args[1]);
    auto direction = direction_arg(args[2]);
    if (!probability || !direction)
    {
      return EXIT_USAGE;
    }
    const std::string committer = line.on_behalf.value_or(signer->address());

    if (line.command == "commit")
    {
      beright::service::CommitResult result;
      if (line.retry)
      {
        result = ctx->committer().commit_on_behalf(*signer, committer, args[0], *probability,
                                                   *direction);
      }
      else
      {
        result = ctx->service().commit_on_behalf(*signer, committer, args[0], *probability,
                                                 *direction);
      }
      if (!result)
      {
        return report_failure(result.error());
      }
      print_receipt(*result);
      return 0;
    }

    const auto commitment =
        ctx->service().make_commitment(committer, args[0], *probability, *direction);

    if (line.command == "resolve")
    {
      auto occurred = outcome_arg(args[3]);
      if (!occurred)
      {
        return EXIT_USAGE;
      }
      auto result = ctx->service().resolve(*signer, commitment, *occurred);
      if (!result)
      {
        return report_failure(result.error());
      }
      print_receipt(*result);
      const double score = beright::scoring::brier_score(commitment.probability, *occurred);
      const auto band = beright::scoring::interpret_brier_score(score, ctx->bands());
      std::cout << "brier:     " << score << " " << beright::scoring::to_string(band) << " ("
                << beright::scoring::describe(band) << ")" << std::endl;
      return 0;
    }

    auto prior = ctx->service().find_prior_commitment(*signer, commitment);
    if (!prior)
    {
      return report_failure(prior.error());
    }
    if (!*prior)
    {
      std::cout << "no matching commitment in recent history" << std::endl;
      return 1;
    }
    std::cout << "signature: " << (*prior)->signature << "\n"
              << "explorer:  " << (*prior)->explorer_url << std::endl;
    return 0;
  }

} // namespace

int main(int argc, char **argv)
{
  auto line = parse_command_line(argc, argv);
  if (!line)
  {
    return EXIT_USAGE;
  }

  if (line->command == "decode" || line->command == "score")
  {
    auto settings = beright::app::load_offline_settings(line->config_path, line->config_given);
    if (!settings)
    {
      return 1;
    }
    return line->command == "decode" ? run_decode(line->args, *settings)
                                     : run_score(line->args, *settings);
  }
  if (line->command == "commit" || line->command == "resolve" || line->command == "reconcile" ||
      line->command == "balance" || line->command == "batch")
  {
    return run_ledger_command(*line);
  }

  std::cerr << "unknown command: " << line->command << std::endl;
  return EXIT_USAGE;
}
